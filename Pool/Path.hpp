#ifndef POOL_PATH_HPP
#define POOL_PATH_HPP

#include<cstddef>
#include<string>
#include<vector>

namespace Pool {

/* Indices of the users who have exited.  As a
 * settlement history it is in exit order; as a
 * tree key it is sorted.  */
typedef std::vector<std::size_t> Path;

/* Sort into a tree key.  Throws `Pool::ResolveError`
 * if an index appears twice.  */
Path canonical(Path path);

/* `path` plus `u`, as a tree key.  */
Path with(Path const& path, std::size_t u);

bool contains(Path const& path, std::size_t u);

/* `{0,2}` form, for logs and errors.  */
std::string to_string(Path const& path);

}

#endif /* !defined(POOL_PATH_HPP) */
