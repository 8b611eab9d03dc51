#include "runtime/runtime.hpp"

#include "glog/logging.h"

namespace runtime {

Runtime::store_t* Runtime::Runtimes_() {
  static store_t* runtimes = new store_t;
  return runtimes;
}

void Runtime::Register_(Runtime::create_t create, Runtime::score_t score) {
  Runtimes_()->emplace_back(create, score);
}

std::unique_ptr<Runtime> Runtime::Create() {
  const store_t& runtimes = *Runtimes_();
  int best_score = 0;
  int best_runtime = -1;
  for (size_t i = 0; i < runtimes.size(); i++) {
    int score = runtimes[i].second();
    if (score > best_score) {
      best_score = score;
      best_runtime = i;
    }
  }
  if (best_runtime == -1) {
    throw runtime_failure("No container runtime could be found");
  }
  std::unique_ptr<Runtime> runtime(runtimes[best_runtime].first());
  LOG(INFO) << "Using the " << runtime->Name() << " container runtime";
  return runtime;
}

}  // namespace runtime
