#include "SysMeshScene.hpp"

#include <filesystem>
#include <system_error>

SysMeshScene::SysMeshScene() = default;

SysMeshScene::~SysMeshScene() = default;

std::vector<SysMeshId> SysMeshScene::hierarchyMeshIds(const SysMeshId& root) const
{
    std::vector<SysMeshId> result;
    if (root.empty())
        return result;

    const std::string prefix = root.back() == '|' ? root : root + '|';

    for (const SysMeshId& id : allMeshIds())
    {
        if (id == root || id.rfind(prefix, 0) == 0)
            result.push_back(id);
    }

    return result;
}

bool SysMeshScene::textureFileExists(const std::string& path) const
{
    if (path.empty())
        return false;

    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}
