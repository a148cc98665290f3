#pragma once

#include <functional>
#include <string>

namespace nutrition::backup {

/*
  A scheduled export or import.

  run completes its own promise; it must not throw.
*/
struct BackupTask {
  std::string           description;
  std::function<void()> run;
};

}
