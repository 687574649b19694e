#ifndef GRAPH_TREENODE_HPP
#define GRAPH_TREENODE_HPP

#include<vector>

namespace Graph {

/** struct Graph::TreeNode<a>
 *
 * @brief node of the shortest-path tree built by
 * Graph::Dijkstra.
 *
 * @desc `parent` is null at the root, which is the
 * search origin; walking `parent` links from any
 * node yields its path back to the origin.
 */
template<typename a>
struct TreeNode {
	a data;
	TreeNode const* parent;
	std::vector<TreeNode const*> children;
};

}

#endif /* !defined(GRAPH_TREENODE_HPP) */
