#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <string_view>

namespace awsctx {

typedef std::list<std::string> Strings;

/**
 * String set with a transparent comparator, so lookups by
 * `std::string_view` do not allocate.
 */
using StringSet = std::set<std::string, std::less<>>;

typedef std::string Path;

/**
 * Look `key` up in an associative container.
 *
 * @return A pointer to the mapped value, or `nullptr` if `key` is
 * absent.
 */
template<class Map, typename K>
const typename Map::mapped_type * get(const Map & map, const K & key)
{
    auto i = map.find(key);
    return i == map.end() ? nullptr : &i->second;
}

template<class Map, typename K>
typename Map::mapped_type * get(Map & map, const K & key)
{
    auto i = map.find(key);
    return i == map.end() ? nullptr : &i->second;
}

/**
 * The result would dangle.
 */
template<class Map, typename K>
typename Map::mapped_type * get(Map && map, const K & key) = delete;

} // namespace awsctx
