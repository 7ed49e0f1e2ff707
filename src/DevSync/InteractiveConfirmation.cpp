// =================================================================
// src/DevSync/InteractiveConfirmation.cpp
// =================================================================

#include "DevSync/InteractiveConfirmation.hpp"
#include "DevSync/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace DevSync {

InteractiveConfirmation::InteractiveConfirmation()
    : m_in(std::cin), m_out(std::cout) {}

InteractiveConfirmation::InteractiveConfirmation(std::istream& in, std::ostream& out)
    : m_in(in), m_out(out) {}

bool InteractiveConfirmation::confirm(const std::string& question) {
    m_out << question << " [y/N]: " << std::flush;

    std::string response;
    if (!std::getline(m_in, response)) {
        m_out << std::endl;
        LOG_DEBUG("Confirmation", "No answer on input, treating as 'no'");
        return false;
    }
    return isAffirmative(response);
}

bool InteractiveConfirmation::isAffirmative(const std::string& answer) {
    std::string response = answer;
    response.erase(0, response.find_first_not_of(" \n\r\t"));
    response.erase(response.find_last_not_of(" \n\r\t") + 1);

    // Convert response to lowercase
    std::transform(response.begin(), response.end(), response.begin(), ::tolower);

    return response == "y" || response == "yes";
}

} // namespace DevSync
