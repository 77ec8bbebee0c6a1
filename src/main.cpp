#include <cstdlib>
#include <iostream>
#include <string>

#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include "ipc/result_pub.hpp"
#include "session/recording_session.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.json>\n"
              << "       " << argv0 << " <magnetics.csv> <positions.csv> [cell_w cell_h]\n";
}

bool parse_double(const std::string& s, double& out) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ALIGNMENT:
        case ErrorKind::EMPTY_INPUT:
        case ErrorKind::INVALID_CELL_SIZE:
            return 3;
        default:
            return 2;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2 && argc != 3 && argc != 5) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        PipelineConfig config;
        if (argc == 2) {
            config = PipelineConfig::load(argv[1]);
        } else {
            config.magnetics.path = argv[1];
            config.positions.path = argv[2];
            config.name = argv[1];
            if (argc == 5) {
                if (!parse_double(argv[3], config.cell_width) ||
                    !parse_double(argv[4], config.cell_height)) {
                    print_usage(argv[0]);
                    return 1;
                }
            }
        }

        std::cout << "IPS recording analyzer - " << config.name << std::endl;

        RecordingSession session(config);
        session.set_log_callback([](const std::string& message) {
            std::cout << "  " << message << std::endl;
        });

        session.run();
        session.write_outputs();

        const auto summary = session.summary();
        if (!config.publish_endpoint.empty()) {
            ResultPub pub(config.publish_endpoint);
            if (!pub.is_connected()) {
                std::cerr << "Failed to bind result publisher to " << config.publish_endpoint << std::endl;
                return 2;
            }
            if (!pub.send("grid", summary.dump())) {
                std::cerr << "Failed to publish result on " << pub.get_bind_address() << std::endl;
                return 2;
            }
            std::cout << "  Published result on " << pub.get_bind_address() << std::endl;
        }

        std::cout << summary.dump(2) << std::endl;

    } catch (const IpsError& e) {
        std::cerr << "Error " << e.describe() << std::endl;
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
