#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "engine.hpp"

/**
 * 这个头文件包含 JSON 请求的分发
 * 每个请求是一个 JSON 对象，op 字段决定请求类型，id 字段（可选）会原样
 * 写回响应中，便于调用方在多 worker 乱序输出时匹配请求和响应。
 *
 * 异常会被转换为 {"error": 错误信息, "retryable": 是否可以重试}：
 * 1. storage_error、concurrency_conflict 可以重试；
 * 2. validation_error、请求格式错误不可以重试。
 */
namespace ctf::server {

struct request_handler {
    explicit request_handler(engine &e);

    /**
     * @brief 处理一个请求，不会抛出异常
     */
    nlohmann::json handle(const nlohmann::json &request);

    /**
     * @brief 处理一行文本形式的请求
     * @return 单行 JSON 响应
     */
    std::string handle_line(const std::string &line);

private:
    nlohmann::json dispatch(const std::string &op, const nlohmann::json &request);

    engine &e;
};

}  // namespace ctf::server
