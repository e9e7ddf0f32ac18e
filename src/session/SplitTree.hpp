#ifndef __CMUX_SPLIT_TREE__
#define __CMUX_SPLIT_TREE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionError.hpp"

namespace cmux {
enum class SplitDirection { Left, Right, Up, Down };

enum class SplitOrientation { Horizontal, Vertical };

/**
 * @brief Parses "left", "right", "up" or "down".
 * @throws SessionError(InvalidArgument) otherwise.
 */
SplitDirection parseSplitDirection(const string& name);
string splitDirectionName(SplitDirection direction);
string orientationName(SplitOrientation orientation);

/**
 * @brief One immutable node of a split layout: either a leaf holding a
 * surface id, or a split holding at least two ordered children and their
 * sizing fractions.
 */
struct SplitNode {
  string surfaceId;
  SplitOrientation orientation = SplitOrientation::Horizontal;
  vector<shared_ptr<const SplitNode>> children;
  vector<double> sizes;

  bool isLeaf() const { return children.empty(); }

  static shared_ptr<const SplitNode> leaf(const string& surfaceId);
  static shared_ptr<const SplitNode> split(
      SplitOrientation orientation,
      const vector<shared_ptr<const SplitNode>>& children,
      const vector<double>& sizes);
};

/**
 * @brief The layout of one workspace, as a persistent (copy-on-write) tree.
 *
 * Nodes are never modified after construction. Every edit builds the
 * replacement path to the root and returns a new tree sharing the untouched
 * subtrees, so a reader holding a SplitTree never observes a partially
 * applied edit and every split it sees has at least two children.
 */
class SplitTree {
 public:
  SplitTree() {}
  explicit SplitTree(shared_ptr<const SplitNode> _root) : root(_root) {}

  static SplitTree withLeaf(const string& surfaceId) {
    return SplitTree(SplitNode::leaf(surfaceId));
  }

  bool empty() const { return root.get() == NULL; }
  shared_ptr<const SplitNode> getRoot() const { return root; }

  /**
   * @brief Replaces the target leaf with a two-child split holding the target
   * and a new leaf, sized 0.5/0.5.
   *
   * Left and up place the new leaf first, right and down place it second.
   * @throws SessionError(NotFound) if the target is not in this tree.
   */
  SplitTree split(const string& target, SplitDirection direction,
                  const string& newSurfaceId) const;

  /**
   * @brief Removes a leaf. The remaining siblings' fractions are renormalized
   * and a split left with one child is replaced by that child. Removing the
   * last leaf yields an empty tree.
   * @throws SessionError(NotFound) if the surface is not in this tree.
   */
  SplitTree remove(const string& surfaceId) const;

  bool contains(const string& surfaceId) const;

  /** @brief All surface ids in visual (left-to-right, top-to-bottom) order. */
  vector<string> leaves() const;

  /**
   * @brief Number of splits between the root and the leaf.
   * @throws SessionError(NotFound) if the surface is not in this tree.
   */
  int depthOf(const string& surfaceId) const;

  /**
   * @brief The closest leaf in the given direction, using the geometry
   * implied by the sizing fractions.
   */
  optional<string> neighbor(const string& surfaceId,
                            SplitDirection direction) const;

  /**
   * @brief The leaf that should receive focus if this surface is removed:
   * the nearest leaf of the following sibling, or of the preceding sibling
   * when the surface is the last child.
   */
  optional<string> successorOf(const string& surfaceId) const;

  /** @brief Number of splits with fewer than two children. */
  int countUnderflows() const;

  json toJson() const;

 protected:
  shared_ptr<const SplitNode> root;
};
}  // namespace cmux

#endif  // __CMUX_SPLIT_TREE__
