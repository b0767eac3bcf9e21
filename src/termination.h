#pragma once

#include "provision_run.h"
#include "util.h"

#include <memory>

namespace strata {

// Install the SIGINT/SIGTERM handler. With no termination_scope active the
// handler restores the cursor and calls _exit(128 + signal).
void termination_handler_install();

// While alive, the first SIGINT requests cancellation through token instead
// of exiting; a second SIGINT exits with 130.
class termination_scope : unmovable {
 public:
  explicit termination_scope(std::shared_ptr<cancellation_token> token);
  ~termination_scope();

 private:
  std::shared_ptr<cancellation_token> token_;
};

}  // namespace strata
