#include "persondir/Directory.hpp"
#include "persondir/Loader.hpp"
#include "persondir/Log.hpp"
#include "persondir/StubPersonAttributeDao.hpp"

namespace persondir {

std::shared_ptr<MergingPersonAttributeDao> build_directory(const Settings& settings,
                                                           const std::vector<std::string>& files) {
    auto username = std::make_shared<SimpleUsernameAttributeProvider>(settings.username_attribute);

    std::vector<std::shared_ptr<PersonAttributeDao>> children;
    children.reserve(files.size());
    for (const auto& file : files) {
        auto child = std::make_shared<StubPersonAttributeDao>(load_people_file(file));
        child->set_username_attribute_provider(username);
        logger()->debug("Loaded {} people from '{}'", child->backing_people().size(), file);
        children.push_back(std::move(child));
    }

    auto directory = std::make_shared<MergingPersonAttributeDao>(std::move(children), settings.make_merger());
    directory->set_username_attribute_provider(username);
    directory->set_recover_exceptions(settings.recover_exceptions);
    return directory;
}

PersonSet merge_people_files(AttributeMerger& merger, const std::vector<std::string>& files) {
    PersonSet merged;
    for (std::size_t i = 0; i < files.size(); ++i) {
        PersonSet people = load_people_file(files[i]);
        if (i == 0) {
            merged = std::move(people);
        } else {
            merger.merge_results(merged, people);
        }
    }
    return merged;
}

} // namespace persondir
