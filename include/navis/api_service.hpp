#pragma once

#include "runtime.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace navis
{

    /**
     * Transport-agnostic request/response facade over the decision core.
     * Each operation takes and returns JSON; failures come back as NavisError
     * so that a transport can map codes to its own status scheme.
     *
     * Operations: analyze-elements, select-action, record-experience,
     * record-user-selection, record-action-result, record-feedback,
     * statistics, health.
     */
    class ApiService
    {
    public:
        explicit ApiService(Runtime &runtime);

        Result<nlohmann::json> handle(const std::string &operation, const nlohmann::json &body);

        static const std::vector<std::string> &operations();

    private:
        Result<nlohmann::json> analyze_elements(const nlohmann::json &body);
        Result<nlohmann::json> select_action(const nlohmann::json &body);
        Result<nlohmann::json> record_experience(const nlohmann::json &body);
        Result<nlohmann::json> record_user_selection(const nlohmann::json &body);
        Result<nlohmann::json> record_action_result(const nlohmann::json &body);
        Result<nlohmann::json> record_feedback(const nlohmann::json &body);
        nlohmann::json statistics() const;
        nlohmann::json health() const;

        /** session_id from the body, or a freshly created session */
        std::string session_for(const nlohmann::json &body);

        Runtime &rt_;
    };

} // namespace navis
