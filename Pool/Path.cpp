#include"Pool/Error.hpp"
#include"Pool/Path.hpp"
#include<algorithm>
#include<sstream>

namespace Pool {

Path canonical(Path path) {
	std::sort(path.begin(), path.end());
	if (std::adjacent_find(path.begin(), path.end()) != path.end())
		throw ResolveError("user exits twice in " + to_string(path));
	return path;
}

Path with(Path const& path, std::size_t u) {
	auto rv = path;
	rv.push_back(u);
	return canonical(std::move(rv));
}

bool contains(Path const& path, std::size_t u) {
	return std::find(path.begin(), path.end(), u) != path.end();
}

std::string to_string(Path const& path) {
	auto os = std::ostringstream();
	os << "{";
	auto first = true;
	for (auto u : path) {
		if (!first)
			os << ",";
		first = false;
		os << u;
	}
	os << "}";
	return os.str();
}

}
