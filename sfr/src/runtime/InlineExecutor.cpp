#include "runtime/InlineExecutor.h"
#include <stdexcept>

namespace SFR {

void InlineExecutor::execute(std::function<void()> task) {
    if (!task) {
        throw std::invalid_argument("InlineExecutor cannot execute an empty task");
    }
    task();
}

}  // namespace SFR
