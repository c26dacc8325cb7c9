#pragma once

#include "fastxls/biff/Record.hpp"
#include "fastxls/core/Expected.hpp"

#include <string>
#include <vector>

namespace fastxls {
namespace biff {

/**
 * @brief 共享字符串表（SST）
 *
 * 工作簿全局区解析时先收集 SST 与其后 CONTINUE 记录的负载，
 * 到达全局区 EOF 时再一次性物化。物化之前的查询返回 SharedStringsNotReady。
 */
class SharedStringTable {
public:
    SharedStringTable() = default;

    /**
     * @brief 以 SST 记录开始一张新表（丢弃之前收集的内容）
     */
    void begin(const Record& sst);

    /**
     * @brief 追加一条 CONTINUE 记录的负载
     */
    void append(const Record& continuation);

    /**
     * @brief 解析全部字符串；重复调用无副作用
     */
    void materialize();

    bool isStarted() const { return started_; }
    bool isMaterialized() const { return materialized_; }

    uint32_t totalCount() const { return total_count_; }
    uint32_t uniqueCount() const { return unique_count_; }
    size_t size() const { return strings_.size(); }

    core::Result<std::string> getString(uint32_t index) const;

private:
    std::vector<std::vector<uint8_t>> segments_;
    std::vector<std::string> strings_;
    uint32_t total_count_ = 0;
    uint32_t unique_count_ = 0;
    bool started_ = false;
    bool materialized_ = false;
};

}} // namespace fastxls::biff
