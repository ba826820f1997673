#ifndef HASHED_SET_H
#define HASHED_SET_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <string_view>
#include <unordered_set>

namespace xnode
{

struct dual_hash
{
    std::uint32_t high = 0;
    std::uint32_t low = 0;
};

// high: seed 5381, h * 33 + c. low: seed 5387, l * 65 + c * 37.
// c is each byte read unsigned (0..255), so UTF-8 members hash the same as
// on the panel side. Must stay bit-compatible with the panel side hashed set.
[[nodiscard]] dual_hash djb2_dual(std::string_view value);

// Set of member ids with an order-independent fingerprint maintained in O(1)
// per mutation by XOR-folding the dual hash of every member.
class hashed_set
{
   public:
    hashed_set() = default;

    void add(const std::string& value);
    void remove(const std::string& value);
    void clear();

    [[nodiscard]] bool contains(const std::string& value) const { return items_.contains(value); }
    [[nodiscard]] std::size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    // 8 hex digits of high followed by 8 of low, lowercase.
    [[nodiscard]] std::string fingerprint() const;
    [[nodiscard]] std::vector<std::string> items() const;

   private:
    std::unordered_set<std::string> items_;
    std::uint32_t hash_high_ = 0;
    std::uint32_t hash_low_ = 0;
};

}    // namespace xnode

#endif
