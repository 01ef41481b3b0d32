#pragma once

#include <functional>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "server/request_handler.hpp"

/**
 * 请求处理 worker
 * 主线程逐行读取请求并推入 request_queue，读完后关闭队列。
 * 每个 worker 从队列中取出请求，交给 request_handler 处理，并通过 emit 输出响应。
 * 不同 worker 的响应输出顺序与请求顺序无关，调用方通过请求的 id 字段匹配响应。
 */
namespace ctf {

/**
 * @brief 一行请求
 */
struct request_task {
    /**
     * @brief 请求所在的行号，从 1 开始，用于日志
     */
    std::size_t line_no = 0;

    std::string text;
};

/**
 * @brief 停止所有的 worker
 * 调用该函数后，worker 在处理完当前请求后退出，不再处理队列中剩余的请求
 */
void stop_workers();

/**
 * @brief 启动请求处理 worker 线程
 * @param worker_id worker 编号，用于日志
 * @param handler 请求处理器，所有 worker 共享
 * @param request_queue 请求队列，队列关闭且为空时 worker 退出
 * @param emit 输出一行响应，会被多个 worker 并发调用，需要自行加锁
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, server::request_handler &handler,
                         concurrent_queue<request_task> &request_queue,
                         std::function<void(const std::string &)> emit);

}  // namespace ctf
