#include "infrastructure/ConsoleProgressBar.hpp"
#include <algorithm>
#include <ostream>
#include <string>

namespace nodewastage::infrastructure {

ConsoleProgressBar::ConsoleProgressBar(std::ostream& out, std::size_t total, std::size_t width)
    : m_out(out), m_total(total), m_width(width == 0 ? 1 : width) {}

void ConsoleProgressBar::update(std::size_t done) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finished) return;
    m_done = std::min(done, m_total);
    draw(m_done);
}

void ConsoleProgressBar::finish() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finished) return;
    m_finished = true;
    draw(m_total);
    m_out << '\n';
    m_out.flush();
}

void ConsoleProgressBar::draw(std::size_t done) {
    std::size_t filled = m_total == 0 ? m_width : (done * m_width) / m_total;
    m_out << '\r' << '[' << std::string(filled, '=') << std::string(m_width - filled, ' ') << "] "
          << done << '/' << m_total;
    m_out.flush();
}

} // namespace nodewastage::infrastructure
