#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "utils/json.hpp"

namespace warden::sandbox {

// Exit statuses of warden_worker. A result document is only written with kExitOk.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitLimitSetup = 3;
inline constexpr int kExitBadRequest = 4;
inline constexpr int kExitResourceLimit = 5;
inline constexpr int kExitInternal = 6;

inline constexpr char kSelfCheckFlag[] = "--self-check";
inline constexpr char kReadyLine[] = "warden_worker ready";

// What the coordinator writes to a worker's stdin. The shared secret is never
// part of it.
struct WorkerRequest {
    std::string code;
    utils::Json context = utils::Json::object();
    std::vector<std::string> allowed_imports;
    std::size_t max_output_bytes = 64 * 1024;
};

utils::Json ToJson(const WorkerRequest& request);
// Throws ProtocolError.
WorkerRequest WorkerRequestFromJson(const utils::Json& data);

}  // namespace warden::sandbox
