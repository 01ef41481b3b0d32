#pragma once

#include <string>

namespace ctf::ledger {

/**
 * @brief 规范化 flag：去掉首尾空白并转换为小写
 */
std::string normalize_flag(const std::string &raw);

/**
 * @brief 比较选手提交的 flag 与题目的正确 flag
 * 双方都先规范化，比较耗时只与较长的字符串长度有关，与第一个不同字符的位置无关
 */
bool check_flag(const std::string &submitted, const std::string &expected);

}  // namespace ctf::ledger
