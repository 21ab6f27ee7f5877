#pragma once
#include <cstddef>
#include <utility>
#include <vector>

// Fixed-capacity rolling window. Once full, each push overwrites the oldest
// element. forEach() visits storage order, not insertion order.
template <typename T, std::size_t MaxN>
class RingBuffer {
    static_assert(MaxN > 0, "RingBuffer capacity must be positive");
public:
    void push_back(T val) {
        if (m_data.size() == MaxN) {
            m_data[m_head] = std::move(val);
        } else {
            m_data.emplace_back(std::move(val));
        }
        m_head = (m_head + 1) % MaxN;
    }

    // Most recently pushed element. Undefined on an empty buffer.
    [[nodiscard]] const T& back() const {
        return m_data[(m_head + MaxN - 1) % MaxN];
    }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& v : m_data) fn(v);
    }

    void clear() noexcept {
        m_data.clear();
        m_head = 0;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_data.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return m_data.empty();
    }

private:
    std::vector<T> m_data;
    std::size_t    m_head{0};
};
