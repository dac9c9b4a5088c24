#pragma once

#include <array>
#include <cstddef>

namespace KinetiCam {

/**
 * @brief Fixed-capacity FIFO, oldest element first
 *
 * Pushing into a full buffer evicts the oldest element. Storage is inline,
 * so pushing never allocates.
 */
template <typename T, std::size_t Capacity>
class RollingBuffer {
    static_assert(Capacity > 0, "RollingBuffer needs a non-zero capacity");

  public:
    void push(const T& value) {
        if (m_size == Capacity) {
            for (std::size_t i = 1; i < Capacity; ++i) {
                m_items[i - 1] = m_items[i];
            }
            m_items[Capacity - 1] = value;
            return;
        }
        m_items[m_size++] = value;
    }

    void clear() { m_size = 0; }

    std::size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }
    bool full() const { return m_size == Capacity; }
    static constexpr std::size_t capacity() { return Capacity; }

    const T& operator[](std::size_t index) const { return m_items[index]; }
    const T& oldest() const { return m_items[0]; }
    const T& newest() const { return m_items[m_size - 1]; }

    const T* begin() const { return m_items.data(); }
    const T* end() const { return m_items.data() + m_size; }

  private:
    std::array<T, Capacity> m_items{};
    std::size_t m_size = 0;
};

} // namespace KinetiCam
