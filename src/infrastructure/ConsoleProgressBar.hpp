/**
 * @file ConsoleProgressBar.hpp
 * @brief Single-line textual progress indicator.
 */

#pragma once
#include <cstddef>
#include <iosfwd>
#include <mutex>

namespace nodewastage::infrastructure {

/**
 * @class ConsoleProgressBar
 * @brief Redraws `[=====     ] done/total` in place on each update.
 */
class ConsoleProgressBar {
public:
    ConsoleProgressBar(std::ostream& out, std::size_t total, std::size_t width = 40);

    /** @brief Redraws the bar for @p done completed steps. */
    void update(std::size_t done);

    /** @brief Draws the final state and terminates the line. Safe to call twice. */
    void finish();

private:
    void draw(std::size_t done);

    std::ostream& m_out;
    std::size_t m_total;
    std::size_t m_width;
    std::size_t m_done = 0;
    bool m_finished = false;
    std::mutex m_mutex;
};

} // namespace nodewastage::infrastructure
