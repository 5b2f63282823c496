#include "command_dispatcher.hpp"

#include <iomanip>
#include <sstream>

namespace g1 {

namespace {

constexpr const char* TAG = "command";

std::string hex_frame(std::span<const uint8_t> frame) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < frame.size(); ++i) {
        if (i) out << ' ';
        out << std::setw(2) << static_cast<int>(frame[i]);
    }
    return out.str();
}

} // namespace

CommandDispatcher::ResponseResult CommandDispatcher::send_command(
        Connection& conn, std::span<const uint8_t> frame, bool expect_response) {
    if (frame.empty()) {
        return ResponseResult::failure(ErrorKind::Protocol, "empty command frame");
    }
    if (!conn.is_connected()) {
        return ResponseResult::failure(ErrorKind::Connection, "not connected to " + conn.address());
    }

    std::vector<std::vector<uint8_t>> unsolicited;
    auto result = exchange(conn, frame, expect_response, unsolicited);

    // Delivered outside the lock so handlers may send commands themselves
    if (on_unsolicited_) {
        for (const auto& other : unsolicited) {
            on_unsolicited_(conn, other);
        }
    }
    return result;
}

CommandDispatcher::ResponseResult CommandDispatcher::exchange(
        Connection& conn, std::span<const uint8_t> frame, bool expect_response,
        std::vector<std::vector<uint8_t>>& unsolicited) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto sent = transport_.send(conn, frame);
    if (!sent) {
        return ResponseResult::failure(sent.error, sent.message);
    }
    logger_.debug(TAG, "-> " + conn.address() + " [" + hex_frame(frame) + "]");

    if (!expect_response) {
        return ResponseResult::success(std::nullopt);
    }

    const uint8_t opcode = frame[0];
    const auto deadline = std::chrono::steady_clock::now() + response_timeout_;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;

        auto received = transport_.receive(conn, remaining);
        if (!received) break;  // timed out

        if (!received->empty() && (*received)[0] == opcode) {
            logger_.debug(TAG, "<- " + conn.address() + " [" + hex_frame(*received) + "]");
            return ResponseResult::success(std::move(received));
        }
        unsolicited.push_back(std::move(*received));
    }

    logger_.debug(TAG, "no response from " + conn.address());
    return ResponseResult::success(std::nullopt);
}

} // namespace g1
