#pragma once

#include <string>

#include <zmq.hpp>

/**
 * @brief A request/reply channel with the backend: every read is answered by exactly one write
 */
class AbstractNetwork
{
public:
    virtual ~AbstractNetwork() {}

    virtual void write(const std::string & content) = 0;
    virtual void read(std::string & received_content) = 0;
};

class Network : public AbstractNetwork
{
public:
    Network() = default;
    Network(const Network &) = delete;
    Network & operator=(const Network &) = delete;
    ~Network();

    void bind(const std::string & socket_endpoint);
    void write(const std::string & content);
    void read(std::string & received_content);

private:
    zmq::context_t _context;
    zmq::socket_t * _socket = nullptr;
};
