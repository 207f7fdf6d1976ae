#include <sphere/analysis/classifier.hpp>
#include <sphere/analysis/dependencies.hpp>

namespace sphere::analysis {

auto classify(const FormulaBatch& batch, const Compiler& compiler)
    -> std::expected<Classification, FormulaError> {
    Classification result;
    for (const auto& entry : batch) {
        auto formula = compiler.compile(entry.text);
        if (!formula) {
            return std::unexpected(formula.error());
        }
        if (uses_scenario_function(**formula)) {
            result.scenario_formulas.insert_or_assign(entry.target, entry.text);
        } else {
            result.row_formulas.insert_or_assign(entry.target, entry.text);
        }
    }
    return result;
}

}  // namespace sphere::analysis
