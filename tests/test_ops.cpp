#include "test_util.hpp"

#include "pipeforge_ir/ops/aggregate.hpp"
#include "pipeforge_ir/ops/filter.hpp"
#include "pipeforge_ir/ops/join.hpp"
#include "pipeforge_ir/ops/map.hpp"
#include "pipeforge_ir/ops/sample.hpp"
#include "pipeforge_ir/ops/select.hpp"
#include "pipeforge_ir/ops/sort.hpp"

#include <algorithm>

namespace pipeforge {
namespace test {

using columnar::DataType;

class OpsTest : public ::testing::Test {
protected:
    void SetUp() override {
        people_ = table(kPeopleCsv);
        sales_ = table(
            "region,item,qty,price\n"
            "north,a,3,1.5\n"
            "south,b,1,2.0\n"
            "north,b,4,\n"
            ",a,2,3.0\n"
            "south,a,5,4.0\n");
    }

    dag::AggregateSpec measures(std::vector<std::string> group_by, std::vector<dag::Measure> list) {
        dag::AggregateSpec spec;
        spec.group_by = std::move(group_by);
        spec.measures = std::move(list);
        return spec;
    }

    std::shared_ptr<columnar::Table> people_;
    std::shared_ptr<columnar::Table> sales_;
};

// ---------------------------------------------------------------------------
// Select
// ---------------------------------------------------------------------------

TEST_F(OpsTest, SelectProjectsInListedOrder) {
    auto result = ops::select(*people_, dag::SelectSpec::parse("city, name"));
    EXPECT_EQ(result->column_names(), (std::vector<std::string>{"city", "name"}));
    EXPECT_EQ(result->num_rows(), 5u);

    auto all = ops::select(*people_, dag::SelectSpec::parse("*"));
    EXPECT_EQ(all->column_names(), people_->column_names());
}

TEST_F(OpsTest, SelectMissingColumnThrows) {
    EXPECT_THROW(ops::select(*people_, dag::SelectSpec::parse("name, salary")), std::invalid_argument);
}

TEST_F(OpsTest, SelectAppliesCasts) {
    auto input = table("n,flag,label\n1.9,true,7\n-2.7,0,x\nabc,maybe,\n");
    dag::SelectSpec spec;
    spec.schema = {{"n", "integer"}, {"flag", "boolean"}, {"label", "string"}, {"absent", "float"}};

    auto result = ops::select(*input, spec);
    EXPECT_EQ(result->get_column("n")->type(), DataType::INT64);
    EXPECT_EQ(cells(*result, "n"), (std::vector<std::string>{"1", "-2", ""}));
    EXPECT_EQ(cells(*result, "flag"), (std::vector<std::string>{"True", "False", ""}));
    EXPECT_EQ(result->get_column("label")->type(), DataType::STRING);
    EXPECT_FALSE(result->has_column("absent"));
}

TEST_F(OpsTest, IntegerCastOutsideInt64RangeIsNull) {
    auto cast_cells = [](const columnar::Table& input, const std::string& name) {
        columnar::Table out;
        out.add_column(name, ops::cast_column(*input.get_column(name), "integer"));
        return cells(out, name);
    };

    auto floats = table("v\n1e30\n-1e300\n42.9\n9.3e18\n");
    ASSERT_EQ(floats->get_column("v")->type(), DataType::FLOAT64);
    EXPECT_EQ(cast_cells(*floats, "v"), (std::vector<std::string>{"", "", "42", ""}));

    auto text = table("s\n1e30\nx\n-12.5\n");
    EXPECT_EQ(cast_cells(*text, "s"), (std::vector<std::string>{"", "", "-12"}));
}

TEST_F(OpsTest, CastToFloat) {
    auto input = table("v\n1\nx\n2\n");
    auto column = ops::cast_column(*input->get_column("v"), "float");
    EXPECT_EQ(column->type(), DataType::FLOAT64);
    EXPECT_DOUBLE_EQ(std::get<double>(column->value_at(0)), 1.0);
    EXPECT_TRUE(column->is_null(1));
}

// ---------------------------------------------------------------------------
// Filter / Derive
// ---------------------------------------------------------------------------

TEST_F(OpsTest, FilterKeepsMatchingRowsInOrder) {
    auto result = ops::filter(*people_, expr::Expression::parse("city == 'Rome' or age > 50"));
    EXPECT_EQ(cells(*result, "name"), (std::vector<std::string>{"Bob", "Cy", "Eve"}));
}

TEST_F(OpsTest, FilterRowsChecksMaskLength) {
    EXPECT_THROW(ops::filter_rows(*people_, {true, false}), std::invalid_argument);
}

TEST_F(OpsTest, DeriveAddsOrReplacesColumn) {
    auto added = ops::derive(*people_, "next_age", expr::Expression::parse("age + 1"));
    EXPECT_EQ(added->column_names().back(), "next_age");
    EXPECT_EQ(cells(*added, "next_age")[0], "35");

    auto replaced = ops::derive(*people_, "age", expr::Expression::parse("age * 2"));
    EXPECT_EQ(replaced->column_names(), people_->column_names());
    EXPECT_EQ(cells(*replaced, "age")[1], "34");

    // Input untouched
    EXPECT_EQ(cells(*people_, "age")[1], "17");
}

TEST_F(OpsTest, DeriveNulls) {
    auto result = ops::derive_nulls(*people_, "score");
    ASSERT_TRUE(result->has_column("score"));
    for (size_t i = 0; i < result->num_rows(); ++i) {
        EXPECT_TRUE(result->get_column("score")->is_null(i));
    }
}

// ---------------------------------------------------------------------------
// Aggregate
// ---------------------------------------------------------------------------

TEST_F(OpsTest, AggregateGroupsInKeyOrderWithNullsLast) {
    auto result = ops::aggregate(*sales_, measures({"region"}, {{"qty", "sum", ""}, {"price", "mean", "avg_price"}}));

    EXPECT_EQ(result->column_names(), (std::vector<std::string>{"region", "sum_qty", "avg_price"}));
    EXPECT_EQ(cells(*result, "region"), (std::vector<std::string>{"north", "south", ""}));
    EXPECT_EQ(result->get_column("sum_qty")->type(), DataType::INT64);
    EXPECT_EQ(cells(*result, "sum_qty"), (std::vector<std::string>{"7", "6", "2"}));
    EXPECT_EQ(cells(*result, "avg_price"), (std::vector<std::string>{"1.5", "3", "3"}));
}

TEST_F(OpsTest, AggregateFunctions) {
    std::vector<size_t> rows{0, 1, 2, 3, 4};
    const auto& qty = *sales_->get_column("qty");
    const auto& price = *sales_->get_column("price");

    EXPECT_EQ(std::get<int64_t>(ops::reduce(ops::AggregateFunction::COUNT, price, rows)), 4);
    EXPECT_DOUBLE_EQ(std::get<double>(ops::reduce(ops::AggregateFunction::MEDIAN, qty, rows)), 3.0);
    EXPECT_DOUBLE_EQ(std::get<double>(ops::reduce(ops::AggregateFunction::VARIANCE, qty, rows)), 2.5);
    EXPECT_EQ(std::get<int64_t>(ops::reduce(ops::AggregateFunction::MAX, qty, rows)), 5);
    EXPECT_EQ(std::get<std::string>(ops::reduce(ops::AggregateFunction::MIN, *sales_->get_column("item"), rows)), "a");
    EXPECT_EQ(std::get<int64_t>(ops::reduce(ops::AggregateFunction::NUNIQUE, *sales_->get_column("item"), rows)), 2);
    EXPECT_DOUBLE_EQ(std::get<double>(ops::reduce(ops::AggregateFunction::FIRST, price, rows)), 1.5);
    EXPECT_DOUBLE_EQ(std::get<double>(ops::reduce(ops::AggregateFunction::LAST, price, rows)), 4.0);
    EXPECT_TRUE(columnar::is_null(ops::reduce(ops::AggregateFunction::STDDEV, qty, {0})));
}

TEST_F(OpsTest, IntegerSumsAreExact) {
    auto input = table("k,v,b\nx,9007199254740993,true\nx,0,true\ny,9223372036854775807,false\ny,1,true\n");
    auto result = ops::aggregate(*input, measures({"k"}, {{"v", "sum", ""}, {"b", "sum", ""}}));

    EXPECT_EQ(result->get_column("sum_v")->type(), DataType::INT64);
    EXPECT_EQ(cells(*result, "sum_v"), (std::vector<std::string>{"9007199254740993", "-9223372036854775808"}));
    EXPECT_EQ(cells(*result, "sum_b"), (std::vector<std::string>{"2", "1"}));
}

TEST_F(OpsTest, AggregateWithoutGroups) {
    auto result = ops::aggregate(*sales_, measures({}, {{"qty", "max", ""}, {"item", "count", "n"}}));
    EXPECT_EQ(result->num_rows(), 1u);
    EXPECT_EQ(cells(*result, "max_qty"), (std::vector<std::string>{"5"}));
    EXPECT_EQ(cells(*result, "n"), (std::vector<std::string>{"5"}));
}

TEST_F(OpsTest, AggregateWithoutMeasuresGivesDistinctKeys) {
    auto result = ops::aggregate(*sales_, measures({"item"}, {{"", "sum", ""}}));
    EXPECT_EQ(result->column_names(), (std::vector<std::string>{"item"}));
    EXPECT_EQ(cells(*result, "item"), (std::vector<std::string>{"a", "b"}));
}

TEST_F(OpsTest, AggregateErrors) {
    EXPECT_THROW(ops::aggregate(*sales_, measures({"region"}, {{"qty", "mode", ""}})), std::invalid_argument);
    EXPECT_THROW(ops::aggregate(*sales_, measures({"nope"}, {})), std::invalid_argument);
    EXPECT_THROW(ops::aggregate(*sales_, measures({}, {{"item", "mean", ""}})), std::invalid_argument);
    EXPECT_EQ(ops::parse_aggregate_function("avg"), ops::AggregateFunction::MEAN);
}

// ---------------------------------------------------------------------------
// Sort / Sample
// ---------------------------------------------------------------------------

TEST_F(OpsTest, SortIsStableWithNullsLast) {
    auto asc = ops::sort(*sales_, dag::SortSpec::parse("region"));
    EXPECT_EQ(cells(*asc, "item"), (std::vector<std::string>{"a", "b", "b", "a", "a"}));
    EXPECT_EQ(cells(*asc, "region").back(), "");

    auto desc = ops::sort(*sales_, dag::SortSpec::parse("price desc"));
    EXPECT_EQ(cells(*desc, "price"), (std::vector<std::string>{"4", "3", "2", "1.5", ""}));

    auto multi = ops::sort(*people_, dag::SortSpec::parse("city, age DESC"));
    EXPECT_EQ(cells(*multi, "name"), (std::vector<std::string>{"Dee", "Cy", "Ann", "Eve", "Bob"}));
}

TEST_F(OpsTest, SortUnknownColumnThrows) {
    EXPECT_THROW(ops::sort(*people_, dag::SortSpec::parse("salary")), std::invalid_argument);
}

TEST_F(OpsTest, SampleRowsIsSeededAndOrdered) {
    dag::SampleSpec spec;
    spec.n = 3;
    spec.seed = 42;

    auto first = ops::sample(*people_, spec);
    auto second = ops::sample(*people_, spec);
    EXPECT_EQ(first->num_rows(), 3u);
    EXPECT_EQ(cells(*first, "name"), cells(*second, "name"));

    // Chosen rows keep input order
    auto names = cells(*first, "name");
    std::vector<std::string> order{"Ann", "Bob", "Cy", "Dee", "Eve"};
    auto pos = [&order](const std::string& n) { return std::find(order.begin(), order.end(), n) - order.begin(); };
    EXPECT_LT(pos(names[0]), pos(names[1]));
    EXPECT_LT(pos(names[1]), pos(names[2]));

    spec.n = 50;
    EXPECT_EQ(ops::sample(*people_, spec)->num_rows(), 5u);
}

TEST_F(OpsTest, SampleFraction) {
    dag::SampleSpec spec;
    spec.mode = dag::SampleSpec::Mode::FRACTION;
    spec.frac = 1.0;
    EXPECT_EQ(ops::sample(*people_, spec)->num_rows(), 5u);
    spec.frac = 0.0;
    EXPECT_EQ(ops::sample(*people_, spec)->num_rows(), 0u);

    spec.frac = 1.5;
    EXPECT_THROW(ops::sample(*people_, spec), std::invalid_argument);
    spec.mode = dag::SampleSpec::Mode::ROWS;
    spec.n = -1;
    EXPECT_THROW(ops::sample(*people_, spec), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Join
// ---------------------------------------------------------------------------

class JoinTest : public ::testing::Test {
protected:
    void SetUp() override {
        left_ = table("id,name,score\n1,Ann,10\n2,Bob,20\n3,Cy,30\n,Nul,40\n");
        right_ = table("id,score,team\n2,200,red\n1,100,blue\n4,400,green\n2,201,gold\n,999,none\n");
    }

    std::shared_ptr<columnar::Table> run(const std::string& how) {
        dag::JoinSpec spec;
        spec.how = how;
        return ops::join(*left_, *right_, spec);
    }

    std::shared_ptr<columnar::Table> left_;
    std::shared_ptr<columnar::Table> right_;
};

TEST_F(JoinTest, InnerFollowsLeftOrder) {
    auto result = run("inner");
    EXPECT_EQ(result->column_names(),
              (std::vector<std::string>{"id", "name", "score_x", "score_y", "team"}));
    EXPECT_EQ(cells(*result, "name"), (std::vector<std::string>{"Ann", "Bob", "Bob"}));
    EXPECT_EQ(cells(*result, "team"), (std::vector<std::string>{"blue", "red", "gold"}));
}

TEST_F(JoinTest, LeftKeepsUnmatchedAndNullKeys) {
    auto result = run("left");
    EXPECT_EQ(cells(*result, "name"), (std::vector<std::string>{"Ann", "Bob", "Bob", "Cy", "Nul"}));
    EXPECT_EQ(cells(*result, "team"), (std::vector<std::string>{"blue", "red", "gold", "", ""}));
}

TEST_F(JoinTest, RightFollowsRightOrder) {
    auto result = run("right");
    EXPECT_EQ(cells(*result, "id"), (std::vector<std::string>{"2", "1", "4", "2", ""}));
    EXPECT_EQ(cells(*result, "name"), (std::vector<std::string>{"Bob", "Ann", "", "Bob", ""}));
}

TEST_F(JoinTest, OuterAppendsUnmatchedRight) {
    auto result = run("outer");
    EXPECT_EQ(result->num_rows(), 7u);
    EXPECT_EQ(cells(*result, "team"),
              (std::vector<std::string>{"blue", "red", "gold", "", "", "green", "none"}));
    EXPECT_EQ(cells(*result, "id")[5], "4");
}

TEST_F(JoinTest, DifferentKeyNamesKeepBothColumns) {
    auto other = table("emp,team\n3,red\n");
    dag::JoinSpec spec;
    spec.left_keys = {"id"};
    spec.right_keys = {"emp"};
    auto result = ops::join(*left_, *other, spec);
    EXPECT_EQ(result->column_names(), (std::vector<std::string>{"id", "name", "score", "emp", "team"}));
    EXPECT_EQ(cells(*result, "name"), (std::vector<std::string>{"Cy"}));
}

TEST_F(JoinTest, ShortRightKeyListWrapsToFirstKey) {
    auto lhs = table("a,b,name\n1,1,p\n1,2,q\n2,2,r\n");
    auto rhs = table("x,tag\n1,one\n2,two\n");
    dag::JoinSpec spec;
    spec.left_keys = {"a", "b"};
    spec.right_keys = {"x"};

    // Both a and b are matched against x
    auto result = ops::join(*lhs, *rhs, spec);
    EXPECT_EQ(result->column_names(), (std::vector<std::string>{"a", "b", "name", "x", "tag"}));
    EXPECT_EQ(cells(*result, "name"), (std::vector<std::string>{"p", "r"}));
    EXPECT_EQ(cells(*result, "tag"), (std::vector<std::string>{"one", "two"}));
}

TEST_F(JoinTest, Errors) {
    EXPECT_THROW(run("cross"), std::invalid_argument);

    dag::JoinSpec spec;
    spec.left_keys = {"missing"};
    EXPECT_THROW(ops::join(*left_, *right_, spec), std::invalid_argument);
}

} // namespace test
} // namespace pipeforge
