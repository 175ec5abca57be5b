#include "DownloadPipeline.hpp"

#include <algorithm>
#include <thread>

#include "flags.hpp"
#include "logger.hpp"

namespace downloads {

PipelineOptions PipelineOptions::fromFlags() {
  PipelineOptions options;
  if (FLAGS_copy_buffer_size > 0) {
    options.copyBufferSize = static_cast<size_t>(FLAGS_copy_buffer_size);
  }
  if (FLAGS_writer_buffer_size > 0) {
    options.writerBufferSize = static_cast<size_t>(FLAGS_writer_buffer_size);
  }
  if (FLAGS_control_poll_interval_ms > 0) {
    options.pollInterval =
        std::chrono::milliseconds(FLAGS_control_poll_interval_ms);
  }
  return options;
}

DropDownloadPipeline::DropDownloadPipeline(DropWriter& destination,
                                           ControlHandle control,
                                           ProgressHandle progress,
                                           uint64_t size,
                                           const PipelineOptions& options)
    : destination_(destination),
      control_(std::move(control)),
      progress_(std::move(progress)),
      size_(size),
      copyBufferSize_(std::max<size_t>(options.copyBufferSize, 1)),
      pollInterval_(options.pollInterval) {}

bool DropDownloadPipeline::checkControl() {
  if (stopped_) return false;
  ControlState state = control_->get();
  while (state == ControlState::Pause) {
    std::this_thread::sleep_for(pollInterval_);
    state = control_->get();
  }
  if (state == ControlState::Stop) {
    stopped_ = true;
    LOG(DEBUG) << "[Pipeline] Stopped after " << copied_ << "/" << size_
               << " bytes of " << destination_.path().string();
    return false;
  }
  return true;
}

bool DropDownloadPipeline::feed(const char* data, size_t length) {
  size_t consumed = 0;
  while (consumed < length && copied_ < size_) {
    if (!checkControl()) return false;

    uint64_t remaining = size_ - copied_;
    size_t n = std::min<size_t>(copyBufferSize_, length - consumed);
    if (n > remaining) n = static_cast<size_t>(remaining);

    destination_.write(data + consumed, n);
    progress_->add(n);
    copied_ += n;
    consumed += n;
  }
  return copied_ < size_;
}

std::string DropDownloadPipeline::finish() { return destination_.finish(); }

}  // namespace downloads
