#ifndef __service_entry_hpp__
#define __service_entry_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <boost/shared_ptr.hpp>

#include <zmq.hpp>

#include "common/common-utils.hpp"
#include "service/request-handler.hpp"

/* Answers one JSON request per ZeroMQ message on a REP socket,
 * until a shutdown request arrives */
class ServiceEntry {
  shared_ptr<zmq::context_t> zmq_ctx_;
  ServiceConfig config_;
  shared_ptr<RequestHandler> request_handler_;

 public:
  ServiceEntry(
      shared_ptr<zmq::context_t> zmq_ctx,
      const ServiceConfig& config,
      shared_ptr<RequestHandler> request_handler) :
    zmq_ctx_(zmq_ctx),
    config_(config),
    request_handler_(request_handler) {
  }

  void operator()() {
    service_entry();
  }

 private:
  void service_entry();
};

#endif  // defined __service_entry_hpp__
