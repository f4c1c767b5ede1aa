// Full ConnectConfig builder: all available options with defaults.
//
//   cmake -B build -DSTK_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/stk_config

#include "stk/stk.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto config = stk::ConnectConfig::builder()
        .host("localhost")                                        // default: localhost
        .port(5001)                                               // default: 5001
        .ack(true)                                                // default: ACK/NACK on
        .connect_attempts(5)                                      // default: 5 attempts
        .connect_retry_delay(std::chrono::milliseconds(3000))     // default: 3s between attempts
        .send_attempts(1)                                         // default: 1 send per command
        .read_timeout(std::chrono::milliseconds(1000))            // default: 1s idle timeout
        .mode(stk::MessagingMode::Sync)                           // default: synchronous framing
        .on_log([](stk::LogLevel level, const std::string& msg) { // default: silent
            std::cerr << "[stk " << stk::to_string(level) << "] " << msg << std::endl;
        })
        .build();

    auto conn = stk::Connection::create(std::move(config));
    std::cout << "configured for " << conn->endpoint().to_string() << std::endl;
}
