/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <cstring>
#include <string>

#include "service-entry.hpp"

using std::string;

void ServiceEntry::service_entry() {
  CHECK(zmq_ctx_);
  CHECK(request_handler_);
  zmq::socket_t socket(*zmq_ctx_, ZMQ_REP);
  socket.bind(config_.endpoint.c_str());
  LOG(INFO) << "Serving model selection requests on " << config_.endpoint;

  uint num_requests = 0;
  while (!request_handler_->shutdown_requested()) {
    zmq::message_t request_msg;
    socket.recv(&request_msg);
    string request(
        static_cast<const char *>(request_msg.data()), request_msg.size());
    string reply = request_handler_->handle(request);
    zmq::message_t reply_msg(reply.size());
    memcpy(reply_msg.data(), reply.data(), reply.size());
    socket.send(reply_msg);
    num_requests++;
  }
  LOG(INFO) << "Service shut down after " << num_requests << " requests";
}
