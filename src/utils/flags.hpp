#ifndef UTILS_FLAGS_HPP_
#define UTILS_FLAGS_HPP_

#include <gflags/gflags.h>

// 下载核心使用的命令行参数，定义见 flags.cpp
DECLARE_int32(copy_buffer_size);
DECLARE_int32(writer_buffer_size);
DECLARE_int32(control_poll_interval_ms);
DECLARE_string(custom_tbb_parallel_control);
DECLARE_string(http_user_agent);
DECLARE_string(log_dir);
DECLARE_string(log_level);

#endif  // UTILS_FLAGS_HPP_
