#ifndef MANIFOLD_UTILS_TERMINAL_HPP
#define MANIFOLD_UTILS_TERMINAL_HPP

#include <ostream>
#include <string>
#include <string_view>

namespace Manifold::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset        = "\033[0m";
        inline constexpr std::string_view kRed          = "\033[31m";
        inline constexpr std::string_view kCyan         = "\033[36m";
        inline constexpr std::string_view kBrightBlack  = "\033[90m";
        inline constexpr std::string_view kBrightYellow = "\033[93m";
        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    inline constexpr std::string_view kTag = "[Manifold]";

    inline std::string ApplyColor(std::string_view text, std::string_view color) {
        std::string out;
        out.reserve(color.size() + text.size() + Colors::kReset.size());
        out.append(color).append(text).append(Colors::kReset);
        return out;
    }

    namespace Details {
        inline void Line(std::ostream* stream, std::string_view label, std::string_view color, std::string_view message) {
            if (stream == nullptr) return;
            std::string prefix(kTag);
            if (!label.empty()) prefix.append(" ").append(label);
            *stream << ApplyColor(prefix, color) << ' ' << message << '\n';
        }
    }

    // A null stream silences the call.
    inline void Info(std::ostream* stream, std::string_view message) {
        Details::Line(stream, {}, Colors::kTurquoise, message);
    }

    inline void Warn(std::ostream* stream, std::string_view message) {
        Details::Line(stream, "warning:", Colors::kOrange, message);
    }

    inline void Error(std::ostream* stream, std::string_view message) {
        Details::Line(stream, "error:", Colors::kRed, message);
        if (stream != nullptr) stream->flush();
    }
}

#endif // MANIFOLD_UTILS_TERMINAL_HPP
