//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#pragma once

#include <algorithm>

#include <spdlog/sinks/base_sink.h>

namespace Netloc {
namespace Log {

//
// Formatted records appended to 'Buffer' until the capacity reserved at construction is reached, the overflow is
// dropped so the buffer never reallocates
//
template <typename Buffer, typename Mutex>
class MemorySink final : public spdlog::sinks::base_sink<Mutex>
{
public:
    explicit MemorySink(size_t capacity) { m_buffer.reserve(capacity); }

    Buffer& buffer() { return m_buffer; }
    const Buffer& buffer() const { return m_buffer; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override
    {
        spdlog::memory_buf_t record;
        this->formatter_->format(msg, record);

        const auto available = m_buffer.capacity() - m_buffer.size();
        const auto count = std::min(available, record.size());
        m_buffer.insert(std::end(m_buffer), record.data(), record.data() + count);
    }

    void flush_() override {}

private:
    Buffer m_buffer;
};

}  // namespace Log
}  // namespace Netloc
