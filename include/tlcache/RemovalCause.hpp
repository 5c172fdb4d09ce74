#pragma once

#include <string>

/**
 * @brief Причина удаления элемента из memory-уровня
 *
 * - Evicted — вытеснение из-за нехватки места. Копия на диске сохраняется,
 *   следующий get() поднимет значение обратно в память.
 * - Removed — явное действие: remove(), перезапись через put(), evictAll().
 *   Копия на диске удаляется.
 */
enum class RemovalCause {
    Evicted,
    Removed
};

inline std::string toString(RemovalCause cause) {
    switch (cause) {
        case RemovalCause::Evicted: return "EVICTED";
        case RemovalCause::Removed: return "REMOVED";
    }
    return "UNKNOWN";
}
