#include "approval/types.hpp"
#include <iomanip>
#include <sstream>

namespace approval {

std::string format_amount(double amount) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << amount;
    std::string text = ss.str();
    const std::string whole = ".00";
    if (text.size() > whole.size() &&
        text.compare(text.size() - whole.size(), whole.size(), whole) == 0) {
        text.erase(text.size() - whole.size());
    }
    return text;
}

} // namespace approval
