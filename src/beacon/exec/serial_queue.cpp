/**
 * @file serial_queue.cpp
 * @brief Worker loop for SerialQueue.
 */
#include "beacon/exec/serial_queue.hpp"

#include <cstdio>
#include <exception>

namespace beacon::exec {

SerialQueue::SerialQueue(std::string_view label)
  : label_(label)
{
  worker_ = std::thread([this] { run(); });
  worker_id_ = worker_.get_id();
}

SerialQueue::~SerialQueue() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable()) worker_.join();
}

void SerialQueue::async(Job job) {
  enqueue(std::move(job));
}

void SerialQueue::enqueue(Job job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void SerialQueue::run() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
      // Stop only once drained: jobs queued before destruction still run.
      if (jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "[%s] job failed: %s\n", label_.c_str(), ex.what());
    } catch (...) {
      std::fprintf(stderr, "[%s] job failed: non-standard exception\n", label_.c_str());
    }
  }
}

} // namespace beacon::exec
