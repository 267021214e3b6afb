#pragma once

#include <stdexcept>
#include <string>

namespace xpto::omni {

struct omni_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Per-request failures.  The dispatcher turns these into error frames.

struct unknown_endpoint_error : omni_error {
  using omni_error::omni_error;
};

struct malformed_request_error : omni_error {
  using omni_error::omni_error;
};

struct handler_failed_error : omni_error {
  using omni_error::omni_error;
};

// Startup-time failures.  These abort the process.

struct duplicate_handler_error : omni_error {
  using omni_error::omni_error;
};

struct configuration_error : omni_error {
  using omni_error::omni_error;
};

// Non-fatal: the host process could not be watched, so the server shuts
// down instead of running unsupervised.
struct host_process_attach_error : omni_error {
  host_process_attach_error(const std::string& desc, int p)
      : omni_error{desc}, pid{p} {}
  int pid;
};

}  // namespace xpto::omni
