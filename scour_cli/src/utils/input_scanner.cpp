#include "input_scanner.hpp"
#include "../../../libscour/include/image_format.hpp"
#include "../../../libscour/include/logger.hpp"
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using scour::Logger;
using scour::LogLevel;

std::vector<InputJob> collect_inputs(const std::vector<fs::path>& inputs) {
    std::vector<InputJob> result;
    std::set<fs::path> seen;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        auto canonical = fs::weakly_canonical(in, ec);
        if (ec) canonical = fs::absolute(in, ec);
        if (!seen.insert(canonical).second) {
            Logger::log(LogLevel::Warning, "Duplicate input ignored: " + in.string(), "scanner");
            continue;
        }

        if (fs::is_directory(in, ec)) {
            result.push_back({in, true});
        } else if (fs::is_regular_file(in, ec) && scour::lower_extension(in) == ".epub") {
            result.push_back({in, false});
        } else {
            Logger::log(LogLevel::Error, "Not an .epub file or directory: " + in.string(), "scanner");
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " input(s)",
                "scanner");
    return result;
}
