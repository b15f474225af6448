// tests/unit/sema/test_optimize.cpp - Filter and program simplification
//
#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "thingtalk/ast/program.hpp"
#include "thingtalk/sema/optimize.hpp"

namespace thingtalk
{

namespace
{

BooleanExpressionPtr atom(const std::string & name, double value)
{
  return std::make_shared<AtomBooleanExpression>(
    name, ">=", std::make_shared<NumberValue>(value));
}

BooleanExpressionPtr and_of(std::vector<BooleanExpressionPtr> ops)
{
  return std::make_shared<AndBooleanExpression>(std::move(ops));
}

BooleanExpressionPtr or_of(std::vector<BooleanExpressionPtr> ops)
{
  return std::make_shared<OrBooleanExpression>(std::move(ops));
}

TablePtr timeline()
{
  return std::make_shared<InvocationTable>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "home_timeline"));
}

/// Truth value of a filter built from And, Or, Not, True, False and atoms
/// named "a", "b", "c"; bit i of `valuation` is the value of atom i.
bool evaluate(const BooleanExpression * expr, unsigned valuation)
{
  switch (expr->get_kind()) {
    case NodeKind::TrueBooleanExpression:
      return true;
    case NodeKind::FalseBooleanExpression:
      return false;
    case NodeKind::AndBooleanExpression:
      for (const auto & op : cast<AndBooleanExpression>(expr)->operands) {
        if (!evaluate(op.get(), valuation)) {
          return false;
        }
      }
      return true;
    case NodeKind::OrBooleanExpression:
      for (const auto & op : cast<OrBooleanExpression>(expr)->operands) {
        if (evaluate(op.get(), valuation)) {
          return true;
        }
      }
      return false;
    case NodeKind::NotBooleanExpression:
      return !evaluate(cast<NotBooleanExpression>(expr)->expr.get(), valuation);
    case NodeKind::AtomBooleanExpression: {
      const auto index = static_cast<unsigned>(cast<AtomBooleanExpression>(expr)->name[0] - 'a');
      return ((valuation >> index) & 1u) != 0;
    }
    default:
      ADD_FAILURE() << "unexpected " << to_string(expr->get_kind());
      return false;
  }
}

/// Random filters over the atoms "a", "b" and "c"
class FilterGenerator
{
public:
  explicit FilterGenerator(unsigned seed) : rng_(seed) {}

  BooleanExpressionPtr make(int depth)
  {
    switch (pick(depth == 0 ? 3 : 6)) {
      case 0: {
        static const char * const k_names[] = {"a", "b", "c"};
        return atom(k_names[pick(3)], 1);
      }
      case 1:
        return BooleanExpression::true_expr();
      case 2:
        return BooleanExpression::false_expr();
      case 3:
        return std::make_shared<NotBooleanExpression>(make(depth - 1));
      case 4:
        return and_of(operands(depth - 1));
      default:
        return or_of(operands(depth - 1));
    }
  }

private:
  int pick(int n) { return std::uniform_int_distribution<int>(0, n - 1)(rng_); }

  std::vector<BooleanExpressionPtr> operands(int depth)
  {
    std::vector<BooleanExpressionPtr> ops;
    const int count = pick(4);
    for (int i = 0; i < count; ++i) {
      ops.push_back(make(depth));
    }
    return ops;
  }

  std::mt19937 rng_;
};

StatementPtr notify_rule(StreamPtr stream)
{
  return std::make_shared<Rule>(std::move(stream), std::vector<ActionPtr>{Action::notify_action()});
}

}  // namespace

// ============================================================================
// Filters
// ============================================================================

TEST(OptimizeFilterTest, NestedConnectivesAreFlattened)
{
  auto a = atom("a", 1);
  auto b = atom("b", 2);
  auto c = atom("c", 3);
  auto expr = and_of({a, and_of({b, and_of({c, BooleanExpression::true_expr()})})});

  auto result = optimize_filter(expr);
  auto * conj = dyn_cast<AndBooleanExpression>(result.get());
  ASSERT_NE(conj, nullptr);
  ASSERT_EQ(conj->operands.size(), 3u);
  EXPECT_EQ(conj->operands[0].get(), a.get());
  EXPECT_EQ(conj->operands[1].get(), b.get());
  EXPECT_EQ(conj->operands[2].get(), c.get());
}

TEST(OptimizeFilterTest, AbsorbingOperandDecides)
{
  auto a = atom("a", 1);
  EXPECT_TRUE(optimize_filter(and_of({a, BooleanExpression::false_expr()}))->is_false());
  EXPECT_TRUE(optimize_filter(or_of({BooleanExpression::true_expr(), a}))->is_true());
}

TEST(OptimizeFilterTest, EmptyAndSingleConnectives)
{
  EXPECT_TRUE(optimize_filter(and_of({}))->is_true());
  EXPECT_TRUE(optimize_filter(or_of({}))->is_false());

  auto a = atom("a", 1);
  EXPECT_EQ(optimize_filter(or_of({a, BooleanExpression::false_expr()})).get(), a.get());
}

TEST(OptimizeFilterTest, NegationIsOnlyRebuilt)
{
  auto expr = std::make_shared<NotBooleanExpression>(and_of({}));
  auto result = optimize_filter(expr);
  auto * negation = dyn_cast<NotBooleanExpression>(result.get());
  ASSERT_NE(negation, nullptr);
  EXPECT_TRUE(negation->expr->is_true());

  auto plain = std::make_shared<NotBooleanExpression>(atom("a", 1));
  EXPECT_EQ(optimize_filter(plain).get(), plain.get());
}

TEST(OptimizeFilterTest, ArgumentIsNotModified)
{
  auto expr = and_of({atom("a", 1), and_of({atom("b", 2)})});
  auto before = expr->clone();
  (void)optimize_filter(expr);
  EXPECT_TRUE(expr->equals(*before));
}

TEST(OptimizeFilterTest, TruthTableIsPreserved)
{
  FilterGenerator generator(1234u);
  for (int i = 0; i < 2000; ++i) {
    const auto expr = generator.make(4);
    const auto optimized = optimize_filter(expr);
    ASSERT_NE(optimized, nullptr);
    for (unsigned valuation = 0; valuation < 8; ++valuation) {
      ASSERT_EQ(evaluate(expr.get(), valuation), evaluate(optimized.get(), valuation))
        << "filter " << i << ", valuation " << valuation;
    }
  }
}

// ============================================================================
// Tables
// ============================================================================

TEST(OptimizeTableTest, TrueFilterIsDropped)
{
  auto inner = timeline();
  auto result =
    optimize_table(std::make_shared<FilteredTable>(inner, BooleanExpression::true_expr()));
  EXPECT_EQ(result.get(), inner.get());
}

TEST(OptimizeTableTest, FalseFilterEmptiesTheTable)
{
  auto filter = and_of({atom("a", 1), BooleanExpression::false_expr()});
  EXPECT_EQ(optimize_table(std::make_shared<FilteredTable>(timeline(), filter)), nullptr);
}

TEST(OptimizeTableTest, NestedFiltersAreMerged)
{
  auto inner_filter = atom("inner", 1);
  auto outer_filter = atom("outer", 2);
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<FilteredTable>(timeline(), inner_filter), outer_filter);

  auto result = optimize_table(table);
  auto * filtered = dyn_cast<FilteredTable>(result.get());
  ASSERT_NE(filtered, nullptr);
  EXPECT_TRUE(isa<InvocationTable>(filtered->table.get()));

  auto * conj = dyn_cast<AndBooleanExpression>(filtered->filter.get());
  ASSERT_NE(conj, nullptr);
  ASSERT_EQ(conj->operands.size(), 2u);
  EXPECT_EQ(conj->operands[0].get(), outer_filter.get());
  EXPECT_EQ(conj->operands[1].get(), inner_filter.get());
}

TEST(OptimizeTableTest, ProjectionOfProjectionKeepsOuterArguments)
{
  auto table = std::make_shared<ProjectionTable>(
    std::make_shared<ProjectionTable>(timeline(), std::vector<std::string>{"text", "author"}),
    std::vector<std::string>{"text"});

  auto result = optimize_table(table);
  auto * proj = dyn_cast<ProjectionTable>(result.get());
  ASSERT_NE(proj, nullptr);
  EXPECT_EQ(proj->args, std::vector<std::string>{"text"});
  EXPECT_TRUE(isa<InvocationTable>(proj->table.get()));
}

TEST(OptimizeTableTest, ProjectionRemovedWhenNotAllowed)
{
  auto table =
    std::make_shared<ProjectionTable>(timeline(), std::vector<std::string>{"text"});
  auto result = optimize_table(table, false);
  EXPECT_TRUE(isa<InvocationTable>(result.get()));
}

TEST(OptimizeTableTest, FilterMovesBelowProjection)
{
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<ProjectionTable>(timeline(), std::vector<std::string>{"text"}),
    atom("count", 1));

  auto result = optimize_table(table);
  auto * proj = dyn_cast<ProjectionTable>(result.get());
  ASSERT_NE(proj, nullptr);
  EXPECT_TRUE(isa<FilteredTable>(proj->table.get()));
}

TEST(OptimizeTableTest, SliceOfOneBecomesIndex)
{
  auto table = std::make_shared<SlicedTable>(
    timeline(), std::make_shared<NumberValue>(3), std::make_shared<NumberValue>(1));

  auto result = optimize_table(table);
  auto * index = dyn_cast<IndexTable>(result.get());
  ASSERT_NE(index, nullptr);
  ASSERT_EQ(index->indices.size(), 1u);
  EXPECT_TRUE(index->indices.front()->equals(NumberValue(3)));
}

TEST(OptimizeTableTest, ArrayIndexIsSpread)
{
  auto indices = std::make_shared<ArrayValue>(std::vector<ValuePtr>{
    std::make_shared<NumberValue>(1), std::make_shared<NumberValue>(2)});
  auto table = std::make_shared<IndexTable>(timeline(), std::vector<ValuePtr>{indices});

  auto result = optimize_table(table);
  auto * index = dyn_cast<IndexTable>(result.get());
  ASSERT_NE(index, nullptr);
  EXPECT_EQ(index->indices.size(), 2u);
}

TEST(OptimizeTableTest, EmptyBranchEmptiesTheJoin)
{
  auto rhs = std::make_shared<FilteredTable>(timeline(), BooleanExpression::false_expr());
  auto join = std::make_shared<JoinTable>(timeline(), rhs, std::vector<InputParamPtr>{});
  EXPECT_EQ(optimize_table(join), nullptr);
}

// ============================================================================
// Streams
// ============================================================================

TEST(OptimizeStreamTest, EdgeOnMonitorIsRedundant)
{
  auto monitor = std::make_shared<MonitorStream>(timeline());
  auto result = optimize_stream(std::make_shared<EdgeNewStream>(monitor));
  EXPECT_EQ(result.get(), monitor.get());
}

TEST(OptimizeStreamTest, MonitorOfProjectionWatchesProjectedFields)
{
  auto monitor = std::make_shared<MonitorStream>(
    std::make_shared<ProjectionTable>(timeline(), std::vector<std::string>{"text"}));

  auto result = optimize_stream(monitor);
  auto * proj = dyn_cast<ProjectionStream>(result.get());
  ASSERT_NE(proj, nullptr);
  auto * inner = dyn_cast<MonitorStream>(proj->stream.get());
  ASSERT_NE(inner, nullptr);
  ASSERT_TRUE(inner->args.has_value());
  EXPECT_EQ(*inner->args, std::vector<std::string>{"text"});
  EXPECT_TRUE(isa<InvocationTable>(inner->table.get()));
}

TEST(OptimizeStreamTest, FilterOfMonitorMovesInside)
{
  auto stream = std::make_shared<FilteredStream>(
    std::make_shared<MonitorStream>(timeline()), atom("count", 1));

  auto result = optimize_stream(stream);
  auto * monitor = dyn_cast<MonitorStream>(result.get());
  ASSERT_NE(monitor, nullptr);
  EXPECT_TRUE(isa<FilteredTable>(monitor->table.get()));
}

// ============================================================================
// Programs
// ============================================================================

TEST(OptimizeProgramTest, EmptyRulesAreDropped)
{
  auto live = notify_rule(std::make_shared<MonitorStream>(timeline()));
  auto dead = notify_rule(std::make_shared<MonitorStream>(
    std::make_shared<FilteredTable>(timeline(), BooleanExpression::false_expr())));
  auto program = std::make_shared<Program>(
    std::vector<ClassDefPtr>{}, std::vector<StatementPtr>{live, dead});

  auto result = optimize_program(program);
  ASSERT_NE(result, nullptr);
  ASSERT_EQ(result->statements.size(), 1u);
  EXPECT_EQ(result->statements.front().get(), live.get());
}

TEST(OptimizeProgramTest, NothingLeft)
{
  auto dead = std::make_shared<Command>(
    std::make_shared<FilteredTable>(timeline(), BooleanExpression::false_expr()),
    std::vector<ActionPtr>{Action::notify_action()});
  auto program =
    std::make_shared<Program>(std::vector<ClassDefPtr>{}, std::vector<StatementPtr>{dead});
  EXPECT_EQ(optimize_program(program), nullptr);
}

TEST(OptimizeProgramTest, ProjectionDroppedWithoutNotify)
{
  auto post = std::make_shared<InvocationAction>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "post"));
  auto command = std::make_shared<Command>(
    std::make_shared<ProjectionTable>(timeline(), std::vector<std::string>{"text"}),
    std::vector<ActionPtr>{post});
  auto program =
    std::make_shared<Program>(std::vector<ClassDefPtr>{}, std::vector<StatementPtr>{command});

  auto result = optimize_program(program);
  ASSERT_NE(result, nullptr);
  EXPECT_TRUE(isa<InvocationTable>(cast<Command>(result->statements.front().get())->table.get()));
}

}  // namespace thingtalk
