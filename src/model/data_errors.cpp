/**
 * @file data_errors.cpp
 * @brief Форматирование сообщений об ошибках данных
 */

#include "data_errors.hpp"
#include <iomanip>
#include <sstream>

namespace drilltrace::model {

std::string OverlapError::formatDepth(double value) {
    std::ostringstream ss;
    ss << std::setprecision(10) << value;
    return ss.str();
}

} // namespace drilltrace::model
