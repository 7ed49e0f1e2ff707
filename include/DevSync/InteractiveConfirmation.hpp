// =================================================================
// include/DevSync/InteractiveConfirmation.hpp
// =================================================================
// Header for the yes/no confirmation asked before destructive steps.

#pragma once

#include <iosfwd>
#include <string>

namespace DevSync {

/**
 * @brief Source of yes/no answers; injected so workflows can run unattended
 */
class ConfirmationProvider {
public:
    virtual ~ConfirmationProvider() = default;

    /**
     * @brief Ask a question and block until it is answered.
     * @return True only for an affirmative answer.
     */
    virtual bool confirm(const std::string& question) = 0;
};

/**
 * @brief Reads one line per question; "y" and "yes" (any case) are affirmative
 *
 * End of input counts as a negative answer.
 */
class InteractiveConfirmation : public ConfirmationProvider {
public:
    InteractiveConfirmation();
    InteractiveConfirmation(std::istream& in, std::ostream& out);

    bool confirm(const std::string& question) override;

    /**
     * @brief True if the answer text is an affirmative response
     */
    static bool isAffirmative(const std::string& answer);

private:
    std::istream& m_in;
    std::ostream& m_out;
};

/**
 * @brief Always gives the same answer (used for --force)
 */
class FixedConfirmation : public ConfirmationProvider {
public:
    explicit FixedConfirmation(bool answer) : m_answer(answer) {}

    bool confirm(const std::string&) override { return m_answer; }

private:
    bool m_answer;
};

} // namespace DevSync
