#pragma once
#include <string>
#include <random>
#include <sstream>

namespace agentlink::core::config {

    // Generates "<prefix>" followed by 8 random hex characters.
    // Used for tmux paste-buffer names and throwaway test roots.
    inline std::string generate_token(const std::string& prefix = "tok-") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace agentlink::core::config
