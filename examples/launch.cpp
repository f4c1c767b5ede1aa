// Launch connectconsole, connect, write a report to disk and shut down.
//
//   STK_INSTALL_DIR=~/stk ./build/stk_launch [vendor-id]

#include "stk/stk.hpp"
#include <iostream>

int main(int argc, char** argv) {
    auto log = [](stk::LogLevel level, const std::string& msg) {
        std::cerr << "[" << stk::to_string(level) << "] " << msg << std::endl;
    };

    try {
        auto launch = stk::LaunchConfig::builder()
            .run_attempts(3)
            .on_log(log);
        if (argc > 1) launch.vendor_id(argv[1]);

        stk::Session session(stk::ConnectConfig::builder().on_log(log).build(), launch.build());
        session.launch();
        session.connect();

        session.send("New / Scenario Launched");
        session.send("New / */Facility Fac1");

        stk::ReportRequest req;
        req.object_path = "Facility/Fac1";
        req.style = "Facility Position";
        req.type = "Export";
        req.file_path = "/tmp/fac1_position.txt";
        session.report(req);

        session.close();
        std::cout << "Report written to " << *req.file_path << std::endl;
    } catch (const stk::StkError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
