// End-to-end smoke test against a running STK Connect socket.
//
// Start STK (or connectconsole --port 5001 --noGraphics), then:
//
//   cmake -B build -DSTK_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/stk_e2e
//
// Override endpoint or framing:
//
//   STK_ENDPOINT=stk-host:5001 STK_ASYNC=1 ./build/stk_e2e

#include "stk/stk.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

static void step(const char* label) {
    std::cout << "  -> " << label << std::endl;
}

int main() {
    std::string endpoint = "localhost:5001";
    if (const char* env = std::getenv("STK_ENDPOINT")) {
        endpoint = env;
    }
    bool async = std::getenv("STK_ASYNC") != nullptr;

    std::cout << std::endl;
    std::cout << "  STK Connect C++ client: E2E smoke test" << std::endl;
    std::cout << "  Endpoint: " << endpoint << (async ? " (async)" : " (sync)") << std::endl;
    std::cout << std::endl;

    try {
        auto conn = stk::Connection::create(
            stk::ConnectConfig::builder()
                .endpoint(endpoint)
                .async_messaging(async)
                .on_log([](stk::LogLevel level, const std::string& msg) {
                    if (level <= stk::LogLevel::Warning) std::cerr << "  !! " << msg << std::endl;
                })
                .build());

        step("connect");
        conn->connect();
        std::cout << "     attempts: " << conn->connect_attempts_used() << std::endl;

        step("new scenario");
        conn->send("Unload / *");
        conn->send("New / Scenario E2E");
        conn->send("SetAnalysisTimePeriod * \"1 Jan 2020 00:00:00.000\" \"1 Jan 2020 01:00:00.000\"");

        step("create satellite");
        conn->send("New / */Satellite Sat1");
        conn->send("SetState */Satellite/Sat1 Classical TwoBody UseScenarioInterval 60 "
                   "ICRF \"1 Jan 2020 00:00:00.000\" 7000000 0 45 0 0 0");

        step("Report_RM");
        stk::ReportRequest req;
        req.object_path = "Satellite/Sat1";
        req.style = "Inertial Position";
        req.time_step = "600";
        auto rows = conn->report_rm(req);
        std::cout << "     rows: " << rows.size() << std::endl;
        for (const auto& row : rows) std::cout << "     " << row << std::endl;

        step("NACK is reported");
        try {
            conn->send("ThisIsNotACommand /");
            std::cerr << "  !! expected a NACK" << std::endl;
        } catch (const stk::StkError& e) {
            std::cout << "     " << e.what() << std::endl;
        }

        step("close");
        conn->close();
    } catch (const stk::StkError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl << "  Done." << std::endl;
    return 0;
}
