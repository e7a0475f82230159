#include "expressions.h"
#include "compiler/attribute.hpp"
#include "compiler/entity.hpp"
#include "compiler/macro.hpp"
#include "runtime/errors.hpp"

#include <cctype>
#include <cmath>

namespace l20n {

// Primary expressions

Value IdentifierExpression::evaluate(const LocalsPtr &, Resolution &resolution, Index) const {
	return resolution.context().lookup(name);
}

Value ThisExpression::evaluate(const LocalsPtr &locals, Resolution &, Index) const {
	if (!locals->self)
		return Undefined{};
	return locals->self;
}

Value VariableExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	const Value *local = locals->find(name);
	if (local && !isUndefined(*local))
		return *local;
	auto it = resolution.data().find(name);
	if (it == resolution.data().end())
		return Undefined{};
	return it->second;
}

Value GlobalExpression::evaluate(const LocalsPtr &, Resolution &resolution, Index) const {
	return resolution.context().global(name);
}

Value LiteralExpression::evaluate(const LocalsPtr &, Resolution &, Index) const { return content; }

// Selectors

// Key of the index head; deferred keys are evaluated with the current locals
static Value keyValue(const IndexKey &key, const LocalsPtr &locals, Resolution &resolution) {
	if (auto *value = std::get_if<Value>(&key))
		return *value;
	Value result = std::get<const Expression *>(key)->evaluate(locals, resolution, Index{});
	if (isPrimitive(result))
		return result;
	return resolution.toText(result);
}

Value SelectorExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const {
	Value key = Undefined{};
	if (const IndexKey *head = index.head())
		key = keyValue(*head, locals, resolution);
	const Expression *member = select(key);
	if (locals->resolve)
		return member->evaluate(locals, resolution, index.rest());
	return Thunk{member, locals};
}

ArrayExpression::ArrayExpression(const Json &node) {
	const Json &elements = requireArray(node, "content");
	if (elements.empty())
		throw MalformedNodeError("array literal has no elements");
	for (size_t elementIndex = 0; elementIndex < elements.size(); elementIndex++) {
		content.push_back(compileExpression(elements[elementIndex]));
		if (flag(elements[elementIndex], "default"))
			defaultKey = elementIndex;
	}
}

const Expression *ArrayExpression::select(const Value &key) const {
	if (isTruthy(key)) {
		if (auto *number = std::get_if<double>(&key)) {
			if (*number >= 0 && *number == std::trunc(*number) && *number < content.size())
				return content[static_cast<size_t>(*number)].get();
		} else if (auto *text = std::get_if<std::string>(&key)) {
			// exact decimal text only, "01" names no element
			bool isDigits = !text->empty() && text->size() < 10 && (text->size() == 1 || (*text)[0] != '0');
			for (char character : *text) {
				if (!std::isdigit(static_cast<unsigned char>(character))) {
					isDigits = false;
					break;
				}
			}
			if (isDigits) {
				size_t position = std::stoul(*text);
				if (position < content.size())
					return content[position].get();
			}
		}
	}
	return content[defaultKey].get();
}

HashExpression::HashExpression(const Json &node) {
	const Json &pairs = requireArray(node, "content");
	if (pairs.empty())
		throw MalformedNodeError("hash literal has no members");
	for (size_t pairIndex = 0; pairIndex < pairs.size(); pairIndex++) {
		const Json &pair = pairs[pairIndex];
		if (kindOf(pair) != NodeKind::KeyValuePair)
			throw MalformedNodeError("hash members must be keyValuePair nodes");
		std::string id = idOf(pair);
		content.push_back(compileExpression(pair));
		members[id] = content.back().get();
		if (pairIndex == 0 || flag(pair, "default"))
			defaultKey = id;
	}
}

const Expression *HashExpression::select(const Value &key) const {
	if (isTruthy(key)) {
		std::string name;
		if (auto *text = std::get_if<std::string>(&key))
			name = *text;
		else if (auto *number = std::get_if<double>(&key))
			name = formatNumber(*number);
		else if (std::holds_alternative<bool>(key))
			name = "true";
		auto it = members.find(name);
		if (it != members.end())
			return it->second;
	}
	return members.at(defaultKey);
}

ComplexStringExpression::ComplexStringExpression(const Json &node) {
	for (const Json &element : requireArray(node, "content")) {
		content.push_back(compileExpression(element));
	}
}

Value ComplexStringExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	Resolution::Guard guard(resolution, this);
	std::string text;
	for (const auto &part : content) {
		text += resolution.toText(part->evaluate(locals, resolution, Index{}));
	}
	return text;
}

// Logical expressions

UnaryExpression::UnaryExpression(const Json &node)
	: op(unaryOperator(requireString(node, "operator"))), operand(compileExpression(requireField(node, "operand"))) {}

Value UnaryExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	return op(operand->evaluate(locals, resolution, Index{}));
}

BinaryExpression::BinaryExpression(const Json &node)
	: left(compileExpression(requireField(node, "left"))), op(binaryOperator(requireString(node, "operator"))),
	  right(compileExpression(requireField(node, "right"))) {}

Value BinaryExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	Value leftValue = left->evaluate(locals, resolution, Index{});
	Value rightValue = right->evaluate(locals, resolution, Index{});
	return op(leftValue, rightValue);
}

Value LogicalExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	Value leftValue = left->evaluate(locals, resolution, Index{});
	Value rightValue = right->evaluate(locals, resolution, Index{});
	return op(leftValue, rightValue);
}

ConditionalExpression::ConditionalExpression(const Json &node)
	: test(compileExpression(requireField(node, "test"))), consequent(compileExpression(requireField(node, "consequent"))),
	  alternate(compileExpression(requireField(node, "alternate"))) {}

Value ConditionalExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index index) const {
	if (isTruthy(test->evaluate(locals, resolution, Index{})))
		return consequent->evaluate(locals, resolution, index);
	return alternate->evaluate(locals, resolution, index);
}

// Member expressions

CallExpression::CallExpression(const Json &node) : callee(compileExpression(requireField(node, "callee"))) {
	for (const Json &argument : requireArray(node, "arguments")) {
		arguments.push_back(compileExpression(argument));
	}
}

Value CallExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	Value target = callee->evaluate(locals, resolution, Index{});
	auto *macro = std::get_if<const Macro *>(&target);
	if (!macro)
		throw TypeMismatchError("cannot call a value of type " + typeName(target));

	std::vector<Value> values;
	values.reserve(arguments.size());
	for (const auto &argument : arguments) {
		values.push_back(argument->evaluate(locals, resolution, Index{}));
	}
	return (*macro)->call(values, resolution);
}

// Name of a computed member, evaluated in the caller's scope
static Value memberKey(const Expression &expression, const LocalsPtr &locals, Resolution &resolution) {
	Value key = expression.evaluate(locals, resolution, Index{});
	if (isPrimitive(key))
		return key;
	return resolution.toText(key);
}

PropertyExpression::PropertyExpression(const Json &node) : expression(compileExpression(requireField(node, "expression"))) {
	if (flag(node, "computed"))
		computedProperty = compileExpression(requireField(node, "property"));
	else
		property = requireString(requireField(node, "property"), "name");
}

Value PropertyExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	Value base = expression->evaluate(locals, resolution, Index{});
	Value key = computedProperty ? memberKey(*computedProperty, locals, resolution) : Value(property);
	Index member{key};

	if (auto *entity = std::get_if<const Entity *>(&base))
		return (*entity)->yield(resolution, member);
	if (auto *attribute = std::get_if<AttributeRef>(&base))
		return attribute->attribute->yield(*attribute->owner, resolution, member);
	if (auto *thunk = std::get_if<Thunk>(&base))
		return thunk->expression->evaluate(thunk->locals, resolution, member);
	throw TypeMismatchError("cannot access member of " + typeName(base));
}

AttributeExpression::AttributeExpression(const Json &node) : expression(compileExpression(requireField(node, "expression"))) {
	if (flag(node, "computed"))
		computedAttribute = compileExpression(requireField(node, "attribute"));
	else
		attribute = requireString(requireField(node, "attribute"), "name");
}

Value AttributeExpression::evaluate(const LocalsPtr &locals, Resolution &resolution, Index) const {
	Value base = expression->evaluate(locals, resolution, Index{});
	auto *entity = std::get_if<const Entity *>(&base);
	if (!entity)
		throw TypeMismatchError("attribute access on " + typeName(base));
	std::string name = computedAttribute ? resolution.toText(computedAttribute->evaluate(locals, resolution, Index{}))
										 : attribute;
	return (*entity)->resolveAttribute(name, resolution);
}

// Dispatch

ExpressionPtr compileExpression(const Json &node) {
	NodeKind kind = kindOf(node);
	switch (kind) {
	case NodeKind::Identifier:
		return std::make_unique<IdentifierExpression>(requireString(node, "name"));
	case NodeKind::This:
		return std::make_unique<ThisExpression>();
	case NodeKind::Variable:
		return std::make_unique<VariableExpression>(requireString(node, "name"));
	case NodeKind::Global:
		return std::make_unique<GlobalExpression>(requireString(node, "name"));
	case NodeKind::Number: {
		const Json &content = requireField(node, "content");
		if (!content.is_number())
			throw MalformedNodeError("number node content must be a number");
		return std::make_unique<LiteralExpression>(content.get<double>());
	}
	case NodeKind::String: {
		const Json &content = requireField(node, "content");
		if (!content.is_string())
			throw MalformedNodeError("string node content must be a string");
		return std::make_unique<LiteralExpression>(content.get<std::string>());
	}
	case NodeKind::Array:
		return std::make_unique<ArrayExpression>(node);
	case NodeKind::Hash:
		return std::make_unique<HashExpression>(node);
	case NodeKind::ComplexString:
		return std::make_unique<ComplexStringExpression>(node);
	case NodeKind::KeyValuePair:
		return compileExpression(requireField(node, "value"));
	case NodeKind::UnaryExpression:
		return std::make_unique<UnaryExpression>(node);
	case NodeKind::BinaryExpression:
		return std::make_unique<BinaryExpression>(node);
	case NodeKind::LogicalExpression: {
		ExpressionPtr left = compileExpression(requireField(node, "left"));
		if (!node.contains("operator") || node["operator"].is_null())
			return left;
		BinaryOperator op = logicalOperator(requireString(node, "operator"));
		return std::make_unique<LogicalExpression>(std::move(left), op, compileExpression(requireField(node, "right")));
	}
	case NodeKind::ConditionalExpression:
		return std::make_unique<ConditionalExpression>(node);
	case NodeKind::CallExpression:
		return std::make_unique<CallExpression>(node);
	case NodeKind::PropertyExpression:
		return std::make_unique<PropertyExpression>(node);
	case NodeKind::AttributeExpression:
		return std::make_unique<AttributeExpression>(node);
	case NodeKind::Entity:
	case NodeKind::Attribute:
	case NodeKind::Macro:
		throw MalformedNodeError(nodeKindToString(kind) + " definition cannot be used as an expression");
	}
	throw MalformedNodeError("unhandled node kind");
}

} // namespace l20n
