/**
 * @file log.cppm
 * @brief coopmod logging - std::format + std::source_location front end,
 *        text or JSON lines to stderr and an optional file
 *
 * Usage Example:
 *   import coopmod.core.log;
 *
 *   // Optional: defaults to console, level info, text format
 *   logger::init("myapp", logger::level::debug);
 *
 *   // Or take the level from COOPMOD_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
 *   logger::init_from_env("myapp");
 *
 *   logger::info("lock acquired by {}", id);
 *   logger::warn("release called twice");
 *   // Text: [timestamp] [level] [name] [file:line] message
 *   // JSON: {"level":"...","logger":"...","message":"...","source":"...","timestamp":"..."}
 *
 *   logger::init_with_file("myapp", "logs/app.log", logger::level::info,
 *                          logger::output_format::json);
 */
module;

#include <coopmod/config.hpp>

export module coopmod.core.log;

import std;

export namespace logger {

    enum class level {
        trace    = 0,
        debug    = 1,
        info     = 2,
        warn     = 3,
        error    = 4,
        critical = 5,
        off      = 6
    };

    enum class output_format {
        text,
        json
    };

    namespace detail {

        /// Process-wide sink configuration, guarded by `mtx` for writers
        struct sink_state {
            std::atomic<level> min_level{level::info};
            output_format format    = output_format::text;
            std::string   name      = "coopmod";
            bool          console   = true;
            std::ofstream file;
            std::mutex    mtx;
        };

        inline sink_state& sink() {
            static sink_state state;
            return state;
        }

        inline constexpr std::array<std::string_view, 7> level_names = {
            "trace", "debug", "info", "warn", "error", "critical", "off"
        };

        // ANSI color per level, same order as level_names
        inline constexpr std::array<std::string_view, 7> level_colors = {
            "\033[37m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[35m", ""
        };

        inline std::string_view level_name(level lv) {
            auto i = static_cast<std::size_t>(lv);
            return i < level_names.size() ? level_names[i] : "unknown";
        }

        /// UTC "YYYY-MM-DD hh:mm:ss.mmm"
        inline std::string timestamp_now() {
            using namespace std::chrono;
            // gmtime_r is not reachable through import std
            auto now = system_clock::now();
            auto day = floor<days>(now);
            year_month_day ymd{day};
            hh_mm_ss tod{floor<milliseconds>(now - day)};
            return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()),
                tod.hours().count(), tod.minutes().count(),
                tod.seconds().count(), tod.subseconds().count());
        }

        /// "dir/sub/file.cpp:42" -> "file.cpp:42"
        inline std::string source_of(const std::source_location& loc) {
            std::string_view path = loc.file_name();
            if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos)
                path.remove_prefix(pos + 1);
            return std::format("{}:{}", path, loc.line());
        }

        /// One JSON object per line (log_impl.cpp, nlohmann::json)
        std::string json_line(level lv, std::string_view timestamp, std::string_view name,
                              std::string_view source, std::string_view message);

        inline std::string text_line(level lv, std::string_view timestamp, std::string_view name,
                                     std::string_view source, std::string_view message,
                                     bool colored) {
            auto lv_name = level_name(lv);
            auto lv_str = colored
                ? std::format("{}{}\033[0m", level_colors[static_cast<std::size_t>(lv)], lv_name)
                : std::string(lv_name);
            return std::format("[{}] [{}] [{}] [{}] {}", timestamp, lv_str, name, source, message);
        }

        inline void write_log(level lv, std::string_view message,
                              const std::source_location& loc) {
            auto& s = sink();
            if (lv < s.min_level.load(std::memory_order_relaxed) || lv == level::off)
                return;

            auto timestamp = timestamp_now();
            auto source = source_of(loc);

            std::lock_guard<std::mutex> lock(s.mtx);
            bool json = s.format == output_format::json;

            if (s.console) {
                std::println(std::cerr, "{}", json
                    ? json_line(lv, timestamp, s.name, source, message)
                    : text_line(lv, timestamp, s.name, source, message, true));
            }
            if (s.file.is_open()) {
                s.file << (json
                    ? json_line(lv, timestamp, s.name, source, message)
                    : text_line(lv, timestamp, s.name, source, message, false)) << '\n';
                s.file.flush();
            }
        }

        /// Format string and call-site location travel together so the
        /// location can default in front of a variadic pack
        template<typename... Args>
        struct fmt_loc {
            std::format_string<Args...> fmt;
            std::source_location loc;

            template<typename S>
            consteval fmt_loc(const S& s,
                const std::source_location& l = std::source_location::current())
                : fmt(s), loc(l) {}
        };

        /// Logging statement at a fixed level: `logger::info("x = {}", x);`
        template<level Lv>
        struct log_at {
            template<typename... Args>
            log_at(fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
                write_log(Lv, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
            }
            log_at(std::string_view msg,
                   const std::source_location& loc = std::source_location::current()) {
                write_log(Lv, msg, loc);
            }
        };
    }

    using trace    = detail::log_at<level::trace>;
    using debug    = detail::log_at<level::debug>;
    using info     = detail::log_at<level::info>;
    using warn     = detail::log_at<level::warn>;
    using error    = detail::log_at<level::error>;
    using critical = detail::log_at<level::critical>;

    // ============================================================================
    // Configuration
    // ============================================================================

    /// Level by name ("warning" is accepted for warn); nullopt if unknown
    inline std::optional<level> parse_level(std::string_view name) {
        if (name == "warning")
            return level::warn;
        for (std::size_t i = 0; i < detail::level_names.size(); ++i) {
            if (detail::level_names[i] == name)
                return static_cast<level>(i);
        }
        return std::nullopt;
    }

    /// Console-only logging; closes a file opened by init_with_file
    inline void init(const std::string& name = "coopmod", level lv = level::info,
                     output_format fmt = output_format::text) {
        auto& s = detail::sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        s.name = name;
        s.min_level.store(lv, std::memory_order_relaxed);
        s.format = fmt;
        s.console = true;
        if (s.file.is_open())
            s.file.close();
    }

    /// Console + file logging. The file is appended to and never colored.
    inline void init_with_file(const std::string& name, const std::string& filepath,
                               level lv = level::info,
                               output_format fmt = output_format::text) {
        auto& s = detail::sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        s.name = name;
        s.min_level.store(lv, std::memory_order_relaxed);
        s.format = fmt;
        s.console = true;
        if (s.file.is_open())
            s.file.close();
        s.file.open(filepath, std::ios::app);
    }

    /**
     * @brief Console logging with the level taken from COOPMOD_LOG_LEVEL.
     * Unset or unrecognized values fall back to `fallback`.
     * @return the level in effect
     */
    inline level init_from_env(const std::string& name = "coopmod",
                               level fallback = level::info) {
        level lv = fallback;
        if (const char* env = std::getenv(COOPMOD_LOG_LEVEL_ENV)) {
            if (auto parsed = parse_level(env))
                lv = *parsed;
        }
        init(name, lv);
        return lv;
    }

    inline void set_level(level lv) {
        detail::sink().min_level.store(lv, std::memory_order_relaxed);
    }

    [[nodiscard]] inline level get_level() {
        return detail::sink().min_level.load(std::memory_order_relaxed);
    }

    inline void set_format(output_format fmt) {
        auto& s = detail::sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        s.format = fmt;
    }

    inline void set_console(bool enabled) {
        auto& s = detail::sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        s.console = enabled;
    }

    inline void flush() {
        auto& s = detail::sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.file.is_open())
            s.file.flush();
    }

    /// Close the file sink; console output continues
    inline void shutdown() {
        auto& s = detail::sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.file.is_open())
            s.file.close();
    }

} // namespace logger
