// gedcom/record/record_classifier.cpp - Record classifier implementation
#include "gedcom/record/record_classifier.hpp"

namespace gedcom
{

Record * RecordClassifier::classify(const syntax::ParseNode & node)
{
  std::vector<Record *> children;
  children.reserve(node.children.size());
  for (const auto & child : node.children) {
    children.push_back(classify(*child));
  }

  RecordFields fields;
  fields.level = node.level;
  fields.tag = ctx_.intern(node.tag);
  fields.pointer = ctx_.intern(node.pointer);
  fields.value = ctx_.intern(node.value);
  fields.children = ctx_.copy_to_arena(children);
  fields.range = node.range;

  return registry_.create(ctx_, fields);
}

std::vector<Record *> RecordClassifier::classify_forest(const syntax::ParseForest & forest)
{
  std::vector<Record *> roots;
  roots.reserve(forest.size());
  for (const auto & node : forest) {
    roots.push_back(classify(*node));
  }
  return roots;
}

}  // namespace gedcom
