#ifndef DOWNLOAD_PIPELINE_HPP_
#define DOWNLOAD_PIPELINE_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "ControlFlag.hpp"
#include "DropWriter.hpp"
#include "ProgressObject.hpp"

namespace downloads {

struct PipelineOptions {
  size_t copyBufferSize = 64 * 1024;
  size_t writerBufferSize = 1024 * 1024;
  std::chrono::milliseconds pollInterval{100};

  // 从 --copy_buffer_size 等命令行参数读取
  static PipelineOptions fromFlags();
};

/**
 * @brief 把一个分块的响应体拷贝进目标文件
 *
 * 响应体以任意大小的数据段送入 feed()，内部再按 copyBufferSize 切分，
 * 每一段写入前都检查控制标志：Stop 立即放弃（不是错误），Pause 原地等待。
 * 写满 size 字节后不再接收任何数据。
 */
class DropDownloadPipeline {
 public:
  DropDownloadPipeline(DropWriter& destination, ControlHandle control,
                       ProgressHandle progress, uint64_t size,
                       const PipelineOptions& options);

  // 返回 false 表示不需要更多数据（已停止或已写满）
  bool feed(const char* data, size_t length);

  // 轮询控制标志，Pause 时阻塞直到 Go 或 Stop；返回 false 表示已停止
  bool checkControl();

  bool stopped() const { return stopped_; }
  bool complete() const { return copied_ == size_; }
  uint64_t copied() const { return copied_; }
  uint64_t size() const { return size_; }

  // 刷新目标文件并返回写入内容的 MD5
  std::string finish();

 private:
  DropWriter& destination_;
  ControlHandle control_;
  ProgressHandle progress_;
  uint64_t size_;
  uint64_t copied_ = 0;
  size_t copyBufferSize_;
  std::chrono::milliseconds pollInterval_;
  bool stopped_ = false;
};

}  // namespace downloads

#endif  // DOWNLOAD_PIPELINE_HPP_
