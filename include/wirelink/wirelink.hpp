#pragma once

// Convenience header pulling in the whole public API

#include "wirelink/error.hpp"
#include "wirelink/async/settlement.hpp"
#include "wirelink/codec/wire_codec.hpp"
#include "wirelink/compression/compression_framer.hpp"
#include "wirelink/connection/connect.hpp"
#include "wirelink/connection/connection.hpp"
#include "wirelink/connection/connection_options.hpp"
#include "wirelink/connection/write_queue.hpp"
#include "wirelink/log/logger.hpp"
#include "wirelink/service/service_listener.hpp"
#include "wirelink/transport/stream.hpp"
#include "wirelink/transport/tls_config.hpp"
