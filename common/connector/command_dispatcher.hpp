#pragma once

#include "logger.hpp"
#include "result.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace g1 {

// Sends a frame and waits for the response carrying the same opcode.
// Frames received while waiting that do not match are handed to the
// unsolicited handler once the exchange is over. One request in flight at a time.
class CommandDispatcher {
public:
    using FrameHandler = std::function<void(Connection&, const std::vector<uint8_t>&)>;
    using ResponseResult = Result<std::optional<std::vector<uint8_t>>>;

    static constexpr std::chrono::milliseconds default_response_timeout{2000};

    CommandDispatcher(Transport& transport, Logger& logger,
                      std::chrono::milliseconds response_timeout = default_response_timeout)
        : transport_(transport), logger_(logger), response_timeout_(response_timeout) {}

    // Send frame; when expect_response is set, wait for the matching response.
    // A value of nullopt means no response was received (or none was expected).
    ResponseResult send_command(Connection& conn, std::span<const uint8_t> frame, bool expect_response);

    void set_unsolicited_handler(FrameHandler handler) { on_unsolicited_ = std::move(handler); }

    std::chrono::milliseconds response_timeout() const { return response_timeout_; }

private:
    // Send and wait under the lock, collecting non-matching frames
    ResponseResult exchange(Connection& conn, std::span<const uint8_t> frame, bool expect_response,
                            std::vector<std::vector<uint8_t>>& unsolicited);

    Transport& transport_;
    Logger& logger_;
    std::chrono::milliseconds response_timeout_;
    FrameHandler on_unsolicited_;
    std::mutex mutex_;
};

} // namespace g1
