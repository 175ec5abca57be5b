#include "flags.hpp"

DEFINE_int32(copy_buffer_size, 64 * 1024,
             "Bytes copied from a chunk response per control-flag check");
DEFINE_int32(writer_buffer_size, 1024 * 1024,
             "Size of the buffered writer in front of each destination file");
DEFINE_int32(control_poll_interval_ms, 100,
             "Sleep between control-flag polls while a download is paused");
DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. allocate:4,verify:2");
DEFINE_string(http_user_agent, "DropDownloader/1.0",
              "User-Agent header sent with every request");
DEFINE_string(log_dir, "logs", "Directory for rotating log files");
DEFINE_string(log_level, "info", "Minimum log level: debug|info|warn|error");
