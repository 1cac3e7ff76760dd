#pragma once

#include "lowerer.hpp"

namespace pipeforge {
namespace codegen {

/**
 * Emits a PySpark script against a SparkSession named `spark`; the
 * script ends with `result = <last>`.
 */
class SparkLowerer : public Lowerer {
public:
    Backend backend() const override { return Backend::SPARK; }

protected:
    void begin(std::ostream& out) override;
    void finish(std::ostream& out, const std::optional<std::string>& last) override;

    void emit(std::ostream& out, const LoweringContext& ctx, const dag::LoadSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::SelectSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::FilterSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::AggregateSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::DeriveSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::SortSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::SampleSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::JoinSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::WriteSpec& spec) override;
    void emit(std::ostream& out, const LoweringContext& ctx, const dag::PassthroughSpec& spec) override;
};

} // namespace codegen
} // namespace pipeforge
