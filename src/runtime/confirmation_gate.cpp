#include "runtime/confirmation_gate.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace saferclaw::runtime {

ConfirmationGate make_interactive_gate(std::istream& in, std::ostream& out) {
    return [&in, &out](const protocol::ActionRequest& request) {
        out << "Approve " << protocol::describe(request) << " ? [y/N]: " << std::flush;
        std::string answer;
        if (!std::getline(in, answer)) {
            return false;
        }
        answer.erase(std::remove_if(answer.begin(), answer.end(),
                                    [](const unsigned char c) {
                                        return std::isspace(c) != 0;
                                    }),
                     answer.end());
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        return answer == "y" || answer == "yes";
    };
}

ConfirmationGate make_auto_approve_gate() {
    return [](const protocol::ActionRequest&) { return true; };
}

ConfirmationGate make_deny_gate() {
    return [](const protocol::ActionRequest&) { return false; };
}

}  // namespace saferclaw::runtime
