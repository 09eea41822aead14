#include "wirelink/connection/connection_options.hpp"
#include "wirelink/log/logger.hpp"

#include <algorithm>

namespace wirelink {

ConnectionOptions& ConnectionOptions::with_idle_timeout(std::chrono::milliseconds timeout) {
    idle_timeout = timeout;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_string_format(codec::StringFormat format) {
    string_format = format;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_read_chunk_size(std::size_t size) {
    read_chunk_size = std::max<std::size_t>(size, 1);
    return *this;
}

ConnectionOptions& ConnectionOptions::with_read_high_water_mark(std::size_t bytes) {
    read_high_water_mark = bytes;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_max_frame_length(std::size_t bytes) {
    max_frame_length = bytes;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_compression_level(int level) {
    compression_level = level;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_tcp_no_delay(bool enabled) {
    tcp_no_delay = enabled;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_logger(std::shared_ptr<ILogger> log) {
    logger = std::move(log);
    return *this;
}

ConnectionOptions& ConnectionOptions::with_bandwidth_stats(std::shared_ptr<IBandwidthStats> stats) {
    bandwidth_stats = std::move(stats);
    return *this;
}

}  // namespace wirelink
