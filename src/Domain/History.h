#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace Domain
{

/// Ring buffer for one time series.
/// Capacity is chosen at runtime from the configured retention window.
template<typename T> class History
{
  public:
    explicit History(std::size_t capacity) : m_Data(std::max<std::size_t>(capacity, 1))
    {
    }

    /// Add a new value, overwriting oldest if full.
    void push(T value)
    {
        m_Data[m_WriteIndex] = value;
        m_WriteIndex = (m_WriteIndex + 1) % m_Data.size();
        if (m_Size < m_Data.size())
        {
            ++m_Size;
        }
    }

    /// Number of valid entries.
    [[nodiscard]] std::size_t size() const
    {
        return m_Size;
    }

    /// Access element by logical index (0 = oldest, size()-1 = newest).
    [[nodiscard]] T operator[](std::size_t index) const
    {
        const std::size_t cap = m_Data.size();
        const std::size_t readIndex = (m_WriteIndex + cap - m_Size + index) % cap;
        return m_Data[readIndex];
    }

    /// Change capacity, keeping the newest values that still fit.
    void resize(std::size_t capacity)
    {
        capacity = std::max<std::size_t>(capacity, 1);
        if (capacity == m_Data.size())
        {
            return;
        }

        const std::size_t keep = std::min(capacity, m_Size);
        std::vector<T> next(capacity);
        for (std::size_t i = 0; i < keep; ++i)
        {
            next[i] = (*this)[m_Size - keep + i];
        }

        m_Data = std::move(next);
        m_Size = keep;
        m_WriteIndex = keep % capacity;
    }

  private:
    std::vector<T> m_Data;
    std::size_t m_WriteIndex = 0;
    std::size_t m_Size = 0;
};

} // namespace Domain
