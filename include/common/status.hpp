#pragma once

namespace ctf {

/**
 * @brief 表示一次 flag 提交的处理结果
 */
enum class submit_status {
    /**
     * @brief flag 正确，提交已写入账本并获得分数
     */
    ACCEPTED = 0,

    /**
     * @brief flag 错误，提交已写入账本，得分为 0
     */
    WRONG_FLAG = 1,

    /**
     * @brief 题目不存在或已下线
     * 不写入账本，调用方不应重试
     */
    CHALLENGE_UNAVAILABLE = 2,

    /**
     * @brief 用户在该题目上的提交次数已达到上限
     * 无论本次 flag 是否正确都会被拒绝，不写入账本
     */
    ATTEMPT_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户已经解出该题目
     * 这是幂等的提示信息而不是错误，不写入账本，避免重复刷分
     */
    ALREADY_SOLVED = 4,

    /**
     * @brief 提交内容不合法，比如去掉首尾空白后为空，或者长度超限，或者用户不存在
     * 在访问账本之前就会被拒绝
     */
    VALIDATION_ERROR = 5
};

const char *get_display_message(submit_status);

/**
 * @brief 表示一次队伍成员变更的处理结果
 */
enum class roster_status {
    OK = 0,
    USER_NOT_FOUND = 1,
    TEAM_NOT_FOUND = 2,

    /**
     * @brief 队伍已解散
     */
    TEAM_INACTIVE = 3,

    /**
     * @brief 队伍人数已达到上限
     * 人数检查与写入成员关系在同一个事务内完成
     */
    TEAM_FULL = 4,

    /**
     * @brief 用户已经在某个队伍中，需要先离队或者使用转会
     */
    ALREADY_IN_TEAM = 5,

    /**
     * @brief 用户不是该队伍的成员
     */
    NOT_A_MEMBER = 6,

    /**
     * @brief 队长在队伍还有其他成员时不能直接离队，需要先转让队长
     */
    CAPTAIN_MUST_TRANSFER = 7,

    /**
     * @brief 只有队长可以执行该操作
     */
    NOT_CAPTAIN = 8,

    /**
     * @brief 新建队伍的参数不合法：名称至少 2 个字符，人数上限在 1 到 10 之间
     */
    INVALID_TEAM = 9
};

const char *get_display_message(roster_status);

}  // namespace ctf
