#ifndef ROUTIX_LOGGER_MANAGER_HPP
#define ROUTIX_LOGGER_MANAGER_HPP

#include <chrono>               // std::chrono::seconds 等时间单位
#include <cstdio>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>                   // 异步模式需要
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h> // 用于彩色控制台输出

#include <routix/utils/config/RoutixConfig.hpp>

namespace routix {

    /**
     * @class LoggerManager
     * @brief 安装全局异步 logger。库内部只通过 SPDLOG_* 宏写日志，不关心 sink。
     *
     * 不调用 init() 时使用 spdlog 自带的默认 logger（同步、控制台）。
     */
    class LoggerManager {
    public:
        /// 日志名，同时是 spdlog 注册表里的 key
        static constexpr const char* kLoggerName = "routix";

        /// 日志格式：时间、线程、源码位置、级别
        static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e %z] [thread %t] [%s:%#] [%^%l%$] %v";

        /**
         * @brief 按 output_type 创建 sink。
         *
         * console / file / all 分别对应彩色控制台、轮转文件、两者都有；
         * off 返回空列表，由调用方决定是否用 null_sink 兜底。
         * @throws spdlog::spdlog_ex 日志文件无法创建
         */
        static std::vector<spdlog::sink_ptr> make_sinks(const LoggingConfig& config) {
            std::vector<spdlog::sink_ptr> sinks;
            const bool console = config.output_type == "console" || config.output_type == "all";
            const bool file = config.output_type == "file" || config.output_type == "all";

            if (console) {
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }
            if (file) {
                const auto max_size = static_cast<std::size_t>(config.max_size_mb) * 1024 * 1024;
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file_path, max_size, static_cast<std::size_t>(config.max_files)));
            }
            return sinks;
        }

        /// @brief 配置对应的日志级别，off 输出时总是 level::off
        static spdlog::level::level_enum level_of(const LoggingConfig& config) {
            if (config.output_type == "off") {
                return spdlog::level::off;
            }
            return spdlog::level::from_str(config.level);
        }

        static void init(const LoggingConfig& config) {
            try {
                // --- 1. sink ---
                std::vector<spdlog::sink_ptr> sinks = make_sinks(config);
                if (sinks.empty()) {
                    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
                }

                // --- 2. 异步 logger（队列 8192，单后台线程）---
                spdlog::init_thread_pool(8192, 1);
                const auto logger = std::make_shared<spdlog::async_logger>(
                    kLoggerName,
                    sinks.begin(), sinks.end(),
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::overrun_oldest
                );

                const spdlog::level::level_enum level = level_of(config);
                logger->set_level(level);
                logger->set_pattern(kPattern);

                // --- 3. 注册为默认 logger，SPDLOG_* 宏都写到这里 ---
                spdlog::set_default_logger(logger);
                spdlog::set_level(level);

                using namespace std::chrono_literals;
                spdlog::flush_every(10s);
                spdlog::flush_on(spdlog::level::err);

                SPDLOG_INFO("routix logger ready, level: {}, output: {}",
                            spdlog::level::to_string_view(level), config.output_type);
            } catch (const spdlog::spdlog_ex& ex) {
                // 日志本身不可用，只能写 stderr
                std::fprintf(stderr, "routix: log init failed: %s\n", ex.what());
            }
        }

        // 在 main 退出前调用
        static void shutdown() {
            spdlog::shutdown();
        }

    private:
        LoggerManager() = default;
    };

} // namespace routix

#endif //ROUTIX_LOGGER_MANAGER_HPP
