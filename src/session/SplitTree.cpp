#include "SplitTree.hpp"

namespace cmux {
namespace {
typedef shared_ptr<const SplitNode> NodePtr;

struct Rect {
  double x;
  double y;
  double width;
  double height;
};

const double EPSILON = 1e-9;

SessionError surfaceNotInTree(const string& surfaceId) {
  return SessionError(ErrorKind::NotFound,
                      "Surface not found in layout: " + surfaceId);
}

NodePtr splitNode(const NodePtr& node, const string& target,
                  SplitDirection direction, const string& newSurfaceId) {
  if (node->isLeaf()) {
    if (node->surfaceId != target) {
      return NodePtr();
    }
    SplitOrientation orientation = (direction == SplitDirection::Left ||
                                    direction == SplitDirection::Right)
                                       ? SplitOrientation::Horizontal
                                       : SplitOrientation::Vertical;
    NodePtr newLeaf = SplitNode::leaf(newSurfaceId);
    bool newFirst = (direction == SplitDirection::Left ||
                     direction == SplitDirection::Up);
    vector<NodePtr> children;
    if (newFirst) {
      children = {newLeaf, node};
    } else {
      children = {node, newLeaf};
    }
    return SplitNode::split(orientation, children, {0.5, 0.5});
  }
  for (size_t i = 0; i < node->children.size(); i++) {
    NodePtr replacement =
        splitNode(node->children[i], target, direction, newSurfaceId);
    if (replacement.get()) {
      vector<NodePtr> children = node->children;
      children[i] = replacement;
      return SplitNode::split(node->orientation, children, node->sizes);
    }
  }
  return NodePtr();
}

// Returns false if the surface is not below node. On success, *replacement is
// the new subtree (null when the whole subtree disappeared).
bool removeNode(const NodePtr& node, const string& surfaceId,
                NodePtr* replacement) {
  if (node->isLeaf()) {
    if (node->surfaceId != surfaceId) {
      return false;
    }
    replacement->reset();
    return true;
  }
  for (size_t i = 0; i < node->children.size(); i++) {
    NodePtr childReplacement;
    if (!removeNode(node->children[i], surfaceId, &childReplacement)) {
      continue;
    }
    if (childReplacement.get()) {
      vector<NodePtr> children = node->children;
      children[i] = childReplacement;
      *replacement = SplitNode::split(node->orientation, children, node->sizes);
      return true;
    }

    vector<NodePtr> children;
    vector<double> sizes;
    double total = 0;
    for (size_t j = 0; j < node->children.size(); j++) {
      if (j == i) {
        continue;
      }
      children.push_back(node->children[j]);
      sizes.push_back(node->sizes[j]);
      total += node->sizes[j];
    }
    if (children.size() == 1) {
      // Collapse: the survivor takes the parent's place
      *replacement = children[0];
      return true;
    }
    for (auto& size : sizes) {
      size = (total > EPSILON) ? size / total : 1.0 / sizes.size();
    }
    *replacement = SplitNode::split(node->orientation, children, sizes);
    return true;
  }
  return false;
}

void collectLeaves(const NodePtr& node, vector<string>* leaves) {
  if (node->isLeaf()) {
    leaves->push_back(node->surfaceId);
    return;
  }
  for (const auto& child : node->children) {
    collectLeaves(child, leaves);
  }
}

int findDepth(const NodePtr& node, const string& surfaceId, int depth) {
  if (node->isLeaf()) {
    return node->surfaceId == surfaceId ? depth : -1;
  }
  for (const auto& child : node->children) {
    int result = findDepth(child, surfaceId, depth + 1);
    if (result >= 0) {
      return result;
    }
  }
  return -1;
}

void layoutRects(const NodePtr& node, const Rect& rect,
                 vector<pair<string, Rect>>* rects) {
  if (node->isLeaf()) {
    rects->push_back(make_pair(node->surfaceId, rect));
    return;
  }
  double offset = 0;
  for (size_t i = 0; i < node->children.size(); i++) {
    Rect childRect = rect;
    if (node->orientation == SplitOrientation::Horizontal) {
      childRect.x = rect.x + offset * rect.width;
      childRect.width = node->sizes[i] * rect.width;
    } else {
      childRect.y = rect.y + offset * rect.height;
      childRect.height = node->sizes[i] * rect.height;
    }
    offset += node->sizes[i];
    layoutRects(node->children[i], childRect, rects);
  }
}

double overlap(double aStart, double aLength, double bStart, double bLength) {
  return min(aStart + aLength, bStart + bLength) - max(aStart, bStart);
}

NodePtr findParent(const NodePtr& node, const string& surfaceId,
                   size_t* indexInParent) {
  if (node->isLeaf()) {
    return NodePtr();
  }
  for (size_t i = 0; i < node->children.size(); i++) {
    const auto& child = node->children[i];
    if (child->isLeaf() && child->surfaceId == surfaceId) {
      *indexInParent = i;
      return node;
    }
    NodePtr parent = findParent(child, surfaceId, indexInParent);
    if (parent.get()) {
      return parent;
    }
  }
  return NodePtr();
}

int underflows(const NodePtr& node) {
  if (node->isLeaf()) {
    return 0;
  }
  int count = node->children.size() < 2 ? 1 : 0;
  for (const auto& child : node->children) {
    count += underflows(child);
  }
  return count;
}

json nodeToJson(const NodePtr& node) {
  json j;
  if (node->isLeaf()) {
    j["type"] = "leaf";
    j["surface"] = node->surfaceId;
    return j;
  }
  j["type"] = "split";
  j["orientation"] = orientationName(node->orientation);
  j["sizes"] = node->sizes;
  json children = json::array();
  for (const auto& child : node->children) {
    children.push_back(nodeToJson(child));
  }
  j["children"] = children;
  return j;
}
}  // namespace

SplitDirection parseSplitDirection(const string& name) {
  string lower = toLower(trim(name));
  if (lower == "left") return SplitDirection::Left;
  if (lower == "right") return SplitDirection::Right;
  if (lower == "up") return SplitDirection::Up;
  if (lower == "down") return SplitDirection::Down;
  throw SessionError(ErrorKind::InvalidArgument,
                     "Invalid direction '" + name +
                         "' (expected left, right, up or down)");
}

string splitDirectionName(SplitDirection direction) {
  switch (direction) {
    case SplitDirection::Left:
      return "left";
    case SplitDirection::Right:
      return "right";
    case SplitDirection::Up:
      return "up";
    case SplitDirection::Down:
      return "down";
  }
  return "unknown";
}

string orientationName(SplitOrientation orientation) {
  return orientation == SplitOrientation::Horizontal ? "horizontal"
                                                     : "vertical";
}

shared_ptr<const SplitNode> SplitNode::leaf(const string& surfaceId) {
  shared_ptr<SplitNode> node(new SplitNode());
  node->surfaceId = surfaceId;
  return node;
}

shared_ptr<const SplitNode> SplitNode::split(
    SplitOrientation orientation,
    const vector<shared_ptr<const SplitNode>>& children,
    const vector<double>& sizes) {
  if (children.size() != sizes.size()) {
    STFATAL << "Split with " << children.size() << " children and "
            << sizes.size() << " sizes";
  }
  shared_ptr<SplitNode> node(new SplitNode());
  node->orientation = orientation;
  node->children = children;
  node->sizes = sizes;
  return node;
}

SplitTree SplitTree::split(const string& target, SplitDirection direction,
                           const string& newSurfaceId) const {
  if (empty()) {
    throw surfaceNotInTree(target);
  }
  NodePtr newRoot = splitNode(root, target, direction, newSurfaceId);
  if (!newRoot.get()) {
    throw surfaceNotInTree(target);
  }
  return SplitTree(newRoot);
}

SplitTree SplitTree::remove(const string& surfaceId) const {
  NodePtr newRoot;
  if (empty() || !removeNode(root, surfaceId, &newRoot)) {
    throw surfaceNotInTree(surfaceId);
  }
  return SplitTree(newRoot);
}

bool SplitTree::contains(const string& surfaceId) const {
  return !empty() && findDepth(root, surfaceId, 0) >= 0;
}

vector<string> SplitTree::leaves() const {
  vector<string> result;
  if (!empty()) {
    collectLeaves(root, &result);
  }
  return result;
}

int SplitTree::depthOf(const string& surfaceId) const {
  int depth = empty() ? -1 : findDepth(root, surfaceId, 0);
  if (depth < 0) {
    throw surfaceNotInTree(surfaceId);
  }
  return depth;
}

optional<string> SplitTree::neighbor(const string& surfaceId,
                                     SplitDirection direction) const {
  if (!contains(surfaceId)) {
    throw surfaceNotInTree(surfaceId);
  }
  vector<pair<string, Rect>> rects;
  layoutRects(root, {0, 0, 1, 1}, &rects);
  Rect from = {0, 0, 0, 0};
  for (const auto& it : rects) {
    if (it.first == surfaceId) {
      from = it.second;
    }
  }

  optional<string> best;
  double bestDistance = 0;
  double bestOverlap = 0;
  for (const auto& it : rects) {
    if (it.first == surfaceId) {
      continue;
    }
    const Rect& to = it.second;
    double distance;
    double shared;
    switch (direction) {
      case SplitDirection::Left:
        distance = from.x - (to.x + to.width);
        shared = overlap(from.y, from.height, to.y, to.height);
        break;
      case SplitDirection::Right:
        distance = to.x - (from.x + from.width);
        shared = overlap(from.y, from.height, to.y, to.height);
        break;
      case SplitDirection::Up:
        distance = from.y - (to.y + to.height);
        shared = overlap(from.x, from.width, to.x, to.width);
        break;
      case SplitDirection::Down:
      default:
        distance = to.y - (from.y + from.height);
        shared = overlap(from.x, from.width, to.x, to.width);
        break;
    }
    if (distance < -EPSILON || shared <= EPSILON) {
      continue;
    }
    if (!best || distance < bestDistance - EPSILON ||
        (fabs(distance - bestDistance) <= EPSILON && shared > bestOverlap)) {
      best = it.first;
      bestDistance = distance;
      bestOverlap = shared;
    }
  }
  return best;
}

optional<string> SplitTree::successorOf(const string& surfaceId) const {
  if (!contains(surfaceId)) {
    throw surfaceNotInTree(surfaceId);
  }
  size_t index = 0;
  NodePtr parent = findParent(root, surfaceId, &index);
  if (!parent.get()) {
    // The surface is the root leaf
    return nullopt;
  }
  vector<string> candidates;
  if (index + 1 < parent->children.size()) {
    collectLeaves(parent->children[index + 1], &candidates);
    return candidates.front();
  }
  collectLeaves(parent->children[index - 1], &candidates);
  return candidates.back();
}

int SplitTree::countUnderflows() const {
  return empty() ? 0 : underflows(root);
}

json SplitTree::toJson() const {
  if (empty()) {
    return json();
  }
  return nodeToJson(root);
}
}  // namespace cmux
