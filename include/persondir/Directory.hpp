/**
 * @file Directory.hpp
 * @brief Assembling a merged directory from person files
 */

#ifndef PERSONDIR_DIRECTORY_HPP
#define PERSONDIR_DIRECTORY_HPP

#include "persondir/Config.hpp"
#include "persondir/MergingPersonAttributeDao.hpp"

#include <memory>
#include <string>
#include <vector>

namespace persondir {

/**
 * @brief One in-memory source per person file, aggregated with the
 *        merger described by @p settings
 *
 * All sources share a single username attribute provider built from
 * `settings.username_attribute`.
 *
 * @throws FileNotFoundError, ConfigParseError, DataFormatError from loading
 * @throws InvalidArgument if the strategy name is unknown
 */
std::shared_ptr<MergingPersonAttributeDao> build_directory(const Settings& settings,
                                                           const std::vector<std::string>& files);

/**
 * @brief Load each person file in order and fold them with @p merger
 *
 * The first file is the starting set; each following file is merged
 * into it. An empty list gives an empty set.
 */
PersonSet merge_people_files(AttributeMerger& merger, const std::vector<std::string>& files);

} // namespace persondir

#endif // PERSONDIR_DIRECTORY_HPP
