#include "network.hpp"

#include <boost/locale.hpp>

#include <stdexcept>

#include <loguru.hpp>

#include "errors.hpp"

using namespace std;

Network::~Network()
{
    delete _socket;
    _socket = nullptr;
}

void Network::bind(const std::string &socket_endpoint)
{
    if (_socket != nullptr)
        throw logic_error("Network already bound");

    _socket = new zmq::socket_t(_context, ZMQ_REP);
    _socket->bind(socket_endpoint);
    LOG_F(INFO, "Waiting for the backend on '%s'", socket_endpoint.c_str());
}

void Network::write(const string &content)
{
    if (_socket == nullptr)
        throw logic_error("Cannot send a reply: the network is not bound");

    // Replies always leave as UTF-8
    const string reply = boost::locale::conv::to_utf<char>(content, "UTF-8");

    LOG_F(INFO, "Reply: '%s'", reply.c_str());
    _socket->send(zmq::buffer(reply), zmq::send_flags::none);
}

void Network::read(string &received_content)
{
    if (_socket == nullptr)
        throw logic_error("Cannot receive a request: the network is not bound");

    zmq::message_t request;
    if (!_socket->recv(request, zmq::recv_flags::none))
        throw ProtocolError("Connection lost");

    const string raw(static_cast<const char *>(request.data()), request.size());
    received_content = boost::locale::conv::from_utf(raw, "UTF-8");

    LOG_F(INFO, "Request: '%s'", received_content.c_str());
}
