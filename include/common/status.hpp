#pragma once

#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 枚举值的大小就是严重程度，值越大越严重，整个提交的结果取所有数据点中最严重的那个
 */
enum class verdict {
    /**
     * @brief 用户程序本测试点评测通过
     * 精确比较时忽略行末空白字符和文末空行
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 包括输出被截断后与标准输出不符的情况
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * CPU 时间和墙上时间任一超出均视为超时，并且优先于输出比较
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     * 峰值常驻内存超过限制时返回
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序出现运行时错误
     * 非零退出码、被信号终止、写文件超出限制、无法执行
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 用户程序编译错误
     */
    COMPILE_ERROR = 5,

    /**
     * @brief 比较程序出错或超时
     * 比较程序的退出码不是约定值时一律返回该结果，不会被当作 WA
     */
    CHECKER_ERROR = 6,

    /**
     * @brief 内部错误，评测系统出错
     */
    INTERNAL_ERROR = 7
};

const char *get_display_message(verdict);

/**
 * @brief 消息中使用的结果名称，比如 "wrong_answer"
 */
const char *to_string(verdict);

/**
 * @throw std::invalid_argument 如果 name 不是已知的评测结果
 */
verdict parse_verdict(const std::string &name);

/**
 * @brief 取两个评测结果中更严重的那个
 */
verdict worst_of(verdict a, verdict b);

/**
 * @brief 取所有评测结果中最严重的那个，空列表视为通过
 */
verdict worst_of(const std::vector<verdict> &verdicts);

}  // namespace arbiter
