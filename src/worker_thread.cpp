#include <treetags/worker_thread.h>

#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <pthread.h>

namespace treetags {
namespace {

struct WorkerContext {
  const std::function<void(std::size_t)> *body = nullptr;
  std::size_t index = 0;
  std::mutex *error_mutex = nullptr;
  std::exception_ptr *error = nullptr;
};

void *RunWorker(void *argument) {
  auto *context = static_cast<WorkerContext *>(argument);
  try {
    (*context->body)(context->index);
  } catch (...) {
    std::lock_guard<std::mutex> lock(*context->error_mutex);
    if (!*context->error) {
      *context->error = std::current_exception();
    }
  }
  return nullptr;
}

class ThreadAttributes {
public:
  ThreadAttributes() {
    if (pthread_attr_init(&attributes_) != 0) {
      throw std::runtime_error("pthread_attr_init failed");
    }
  }
  ~ThreadAttributes() { pthread_attr_destroy(&attributes_); }
  ThreadAttributes(const ThreadAttributes &) = delete;
  ThreadAttributes &operator=(const ThreadAttributes &) = delete;

  pthread_attr_t *get() { return &attributes_; }

private:
  pthread_attr_t attributes_;
};

} // namespace

std::size_t DefaultThreadStackSize() {
  ThreadAttributes attributes;
  std::size_t size = 0;
  if (pthread_attr_getstacksize(attributes.get(), &size) != 0 || size == 0) {
    return kFallbackStackSize;
  }
  return size;
}

std::size_t WorkerStackSize() {
  return DefaultThreadStackSize() * kWorkerStackMultiplier;
}

void RunOnWorkerThreads(std::size_t count,
                        const std::function<void(std::size_t)> &body) {
  ThreadAttributes attributes;
  const auto stack_size = WorkerStackSize();
  if (const auto result =
          pthread_attr_setstacksize(attributes.get(), stack_size);
      result != 0) {
    throw std::runtime_error("Failed to set worker stack size to " +
                             std::to_string(stack_size) + ": " +
                             std::strerror(result));
  }

  std::mutex error_mutex;
  std::exception_ptr error;
  std::vector<std::unique_ptr<WorkerContext>> contexts;
  std::vector<pthread_t> threads;
  contexts.reserve(count);
  threads.reserve(count);

  int create_result = 0;
  for (std::size_t i = 0; i < count; ++i) {
    contexts.push_back(std::make_unique<WorkerContext>(
        WorkerContext{&body, i, &error_mutex, &error}));
    pthread_t thread;
    create_result = pthread_create(&thread, attributes.get(), &RunWorker,
                                   contexts.back().get());
    if (create_result != 0) {
      break;
    }
    threads.push_back(thread);
  }

  for (const auto thread : threads) {
    pthread_join(thread, nullptr);
  }

  if (create_result != 0) {
    throw std::runtime_error("Failed to start worker thread: " +
                             std::string(std::strerror(create_result)));
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

} // namespace treetags
