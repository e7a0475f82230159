#pragma once
#include "compiler/expression.hpp"
#include "compiler/operators.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace l20n {

// Primary expressions

// Entity or macro of the context's resource, looked up at evaluation time
struct IdentifierExpression : Expression {
	std::string name;
	explicit IdentifierExpression(std::string name) : name(std::move(name)) {}
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

struct ThisExpression : Expression {
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// Locals first, then the caller's data
struct VariableExpression : Expression {
	std::string name;
	explicit VariableExpression(std::string name) : name(std::move(name)) {}
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

struct GlobalExpression : Expression {
	std::string name;
	explicit GlobalExpression(std::string name) : name(std::move(name)) {}
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// Number and string literals
struct LiteralExpression : Expression {
	Value content;
	explicit LiteralExpression(Value content) : content(std::move(content)) {}
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// Array and hash literals: take one key from the index and pick a branch,
// falling back to the default branch when the key is missing or falsy
struct SelectorExpression : Expression {
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
	virtual const Expression *select(const Value &key) const = 0;
};

struct ArrayExpression : SelectorExpression {
	std::vector<ExpressionPtr> content;
	size_t defaultKey = 0;
	explicit ArrayExpression(const Json &node);
	const Expression *select(const Value &key) const override;
};

struct HashExpression : SelectorExpression {
	std::vector<ExpressionPtr> content;
	std::unordered_map<std::string, const Expression *> members;
	std::string defaultKey;
	explicit HashExpression(const Json &node);
	const Expression *select(const Value &key) const override;
};

// Literal spans and embedded expressions, concatenated
struct ComplexStringExpression : Expression {
	std::vector<ExpressionPtr> content;
	explicit ComplexStringExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// Logical expressions

struct UnaryExpression : Expression {
	UnaryOperator op;
	ExpressionPtr operand;
	explicit UnaryExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

struct BinaryExpression : Expression {
	ExpressionPtr left;
	BinaryOperator op;
	ExpressionPtr right;
	explicit BinaryExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// Both sides are evaluated before combining
struct LogicalExpression : Expression {
	ExpressionPtr left;
	BinaryOperator op;
	ExpressionPtr right;
	LogicalExpression(ExpressionPtr left, BinaryOperator op, ExpressionPtr right)
		: left(std::move(left)), op(op), right(std::move(right)) {}
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

struct ConditionalExpression : Expression {
	ExpressionPtr test;
	ExpressionPtr consequent;
	ExpressionPtr alternate;
	explicit ConditionalExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// Member expressions

struct CallExpression : Expression {
	ExpressionPtr callee;
	std::vector<ExpressionPtr> arguments;
	explicit CallExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// entry.member: yields from the base with the member as its index
struct PropertyExpression : Expression {
	ExpressionPtr expression;
	std::string property;
	ExpressionPtr computedProperty; // set for entry[expression]
	explicit PropertyExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

// entry::attribute: resolves the attribute to a string
struct AttributeExpression : Expression {
	ExpressionPtr expression;
	std::string attribute;
	ExpressionPtr computedAttribute; // set for entry::[expression]
	explicit AttributeExpression(const Json &node);
	Value evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const override;
};

} // namespace l20n
