/// @file offload.hpp
/// @brief Umbrella header for the offload-cpp library.
///
/// Include this single header for access to all public types:
/// DiscreteWorkerPool, StreamingWorkerSession, MessageChannel,
/// ThreadChannel, ProcessChannel, the message variants, options, JobSpec,
/// logging and Error.

#pragma once

#include <offload-cpp/channel.hpp>
#include <offload-cpp/discrete_pool.hpp>
#include <offload-cpp/error.hpp>
#include <offload-cpp/job_spec.hpp>
#include <offload-cpp/logging.hpp>
#include <offload-cpp/message.hpp>
#include <offload-cpp/options.hpp>
#include <offload-cpp/process_channel.hpp>
#include <offload-cpp/streaming_session.hpp>
#include <offload-cpp/thread_channel.hpp>
#include <offload-cpp/types.hpp>
