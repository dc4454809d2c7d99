#include "SysObjLoader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <glm/glm.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "SysMesh.hpp"

namespace
{
    // Per-object state while reading. OBJ indices are global to the file, each
    // object gets its own compact SysMesh index space.
    struct ObjectBuilder
    {
        std::string                          name;
        std::shared_ptr<SysMesh>             mesh;
        std::string                          material;
        std::unordered_map<int32_t, int32_t> vert_remap;
        std::unordered_map<int32_t, int32_t> uv_remap;
        std::unordered_map<int32_t, int32_t> norm_remap;
        int32_t                              uv_map   = -1;
        int32_t                              norm_map = -1;
    };

    struct FaceCorner
    {
        int32_t v  = -1;
        int32_t vt = -1;
        int32_t vn = -1;
    };

    static std::string to_lower(std::string str)
    {
        std::ranges::transform(str, str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    static std::string trim(const std::string& s)
    {
        const size_t a = s.find_first_not_of(" \t\r\n");
        if (a == std::string::npos)
            return {};
        const size_t b = s.find_last_not_of(" \t\r\n");
        return s.substr(a, b - a + 1);
    }

    // Resolves a 1-based (or negative, relative) OBJ index against @p count entries.
    // @return A 0-based index, or -1 if the reference is missing or out of range.
    static int32_t resolve_index(const std::string& token, size_t count)
    {
        if (token.empty())
            return -1;

        int32_t value = 0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc() || ptr != token.data() + token.size() || value == 0)
            return -1;

        const int64_t index = value > 0 ? int64_t(value) - 1 : int64_t(count) + value;
        if (index < 0 || index >= static_cast<int64_t>(count))
            return -1;

        return static_cast<int32_t>(index);
    }

    static FaceCorner parse_corner(const std::string& token,
                                   size_t             num_pos,
                                   size_t             num_tex,
                                   size_t             num_norm)
    {
        FaceCorner corner;

        std::string parts[3];
        int         part = 0;
        for (char c : token)
        {
            if (c == '/')
            {
                if (++part > 2)
                    break;
                continue;
            }
            parts[part].push_back(c);
        }

        corner.v  = resolve_index(parts[0], num_pos);
        corner.vt = resolve_index(parts[1], num_tex);
        corner.vn = resolve_index(parts[2], num_norm);
        return corner;
    }

    static int32_t remap(std::unordered_map<int32_t, int32_t>& table, int32_t global, auto create)
    {
        if (auto it = table.find(global); it != table.end())
            return it->second;

        const int32_t local = create();
        table.emplace(global, local);
        return local;
    }

    static ObjectBuilder& object_named(std::vector<ObjectBuilder>&              objects,
                                       std::unordered_map<std::string, size_t>& by_name,
                                       const std::string&                       name)
    {
        if (auto it = by_name.find(name); it != by_name.end())
            return objects[it->second];

        ObjectBuilder builder;
        builder.name = name;
        builder.mesh = std::make_shared<SysMesh>();
        objects.push_back(std::move(builder));
        by_name.emplace(name, objects.size() - 1);
        return objects.back();
    }

    static uint32_t add_material(const std::string& name, ObjMaterials& materials)
    {
        for (uint32_t i = 0; i < materials.size(); ++i)
        {
            if (to_lower(name) == to_lower(materials[i].name))
                return i;
        }

        ObjMaterial mat = {};
        mat.name        = name;
        mat.Kd          = glm::vec3(0.8f, 0.8f, 0.8f);
        materials.push_back(mat);
        return static_cast<uint32_t>(materials.size() - 1);
    }

} // namespace

// -------------------------------------------------------------------------------

bool loadObjObjects(const std::string& filepath,
                    std::vector<ObjObject>& objects,
                    ObjMaterials& materials,
                    ObjLoadReport& report)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        report.error("Failed to open OBJ file: " + filepath, ObjLoadStatus::FileNotFound);
        return false;
    }

    const std::filesystem::path path = filepath;
    return loadObjStream(file, path.parent_path().string(), objects, materials, report);
}

bool loadObjStream(std::istream& in,
                   const std::string& base_dir,
                   std::vector<ObjObject>& objects,
                   ObjMaterials& materials,
                   ObjLoadReport& report)
{
    std::vector<glm::vec3> positions;
    std::vector<glm::vec2> texcoords;
    std::vector<glm::vec3> normals;

    std::vector<ObjectBuilder>              builders;
    std::unordered_map<std::string, size_t> by_name;

    // Object active when each position was declared (kNoOwner before the first
    // one) and whether any face used it.
    constexpr size_t    kNoOwner = static_cast<size_t>(-1);
    std::vector<size_t> vert_owner;
    std::vector<bool>   vert_used;

    ObjectBuilder* current = nullptr;
    std::string    mat_lib;
    std::string    mat_name;
    std::string    line;
    size_t         line_no = 0;

    while (std::getline(in, line))
    {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::istringstream sstream(line);
        std::string        prefix;
        sstream >> prefix;

        if (prefix.empty() || prefix[0] == '#')
            continue;

        if (prefix == "mtllib")
        {
            std::getline(sstream, mat_lib);
            mat_lib = trim(mat_lib);
        }
        else if (prefix == "usemtl")
        {
            std::getline(sstream, mat_name);
            mat_name = trim(mat_name);
            if (!mat_name.empty())
                add_material(mat_name, materials);
        }
        else if (prefix == "o" || prefix == "g")
        {
            std::string name;
            std::getline(sstream, name);
            name = trim(name);

            // "g" may list several groups; the first one names the object.
            if (prefix == "g")
                name = name.substr(0, name.find_first_of(" \t"));

            if (name.empty())
                name = "default";

            current = &object_named(builders, by_name, name);
        }
        else if (prefix == "v")
        {
            glm::vec3 pos(0.f);
            if (!(sstream >> pos.x >> pos.y >> pos.z))
                report.warning("line " + std::to_string(line_no) + ": malformed vertex position");
            positions.push_back(pos);
            vert_owner.push_back(current ? static_cast<size_t>(current - builders.data()) : kNoOwner);
            vert_used.push_back(false);
        }
        else if (prefix == "vt")
        {
            glm::vec2 uv(0.f);
            if (!(sstream >> uv.x >> uv.y))
                report.warning("line " + std::to_string(line_no) + ": malformed texture coordinate");
            texcoords.push_back(uv);
        }
        else if (prefix == "vn")
        {
            glm::vec3 norm(0.f);
            if (!(sstream >> norm.x >> norm.y >> norm.z))
                report.warning("line " + std::to_string(line_no) + ": malformed normal");
            normals.push_back(norm);
        }
        else if (prefix == "f")
        {
            std::vector<FaceCorner> corners;
            std::string             token;
            bool                    valid = true;
            while (sstream >> token)
            {
                const FaceCorner c = parse_corner(token, positions.size(), texcoords.size(), normals.size());
                if (c.v < 0)
                    valid = false;
                corners.push_back(c);
            }

            if (!valid || corners.size() < 3)
            {
                report.warning("line " + std::to_string(line_no) + ": face skipped (" +
                               (valid ? "fewer than 3 corners" : "missing vertex reference") + ")");
                continue;
            }

            if (!current)
                current = &object_named(builders, by_name, "default");

            ObjectBuilder& obj  = *current;
            SysMesh&       mesh = *obj.mesh;

            SysPolyVerts pv, pt, pn;
            pv.reserve(corners.size());
            for (const FaceCorner& c : corners)
            {
                pv.push_back(remap(obj.vert_remap, c.v, [&] { return mesh.create_vert(positions[c.v]); }));
                vert_used[c.v] = true;
            }

            const bool has_uvs   = std::ranges::all_of(corners, [](const FaceCorner& c) { return c.vt >= 0; });
            const bool has_norms = std::ranges::all_of(corners, [](const FaceCorner& c) { return c.vn >= 0; });

            if (has_uvs)
            {
                if (obj.uv_map < 0)
                    obj.uv_map = mesh.map_create(kSysUvMapId, 0, 2);

                for (const FaceCorner& c : corners)
                {
                    pt.push_back(remap(obj.uv_remap, c.vt, [&] {
                        return mesh.map_create_vert(obj.uv_map, &texcoords[c.vt][0]);
                    }));
                }
            }

            if (has_norms)
            {
                if (obj.norm_map < 0)
                    obj.norm_map = mesh.map_create(kSysNormalMapId, 0, 3);

                for (const FaceCorner& c : corners)
                {
                    pn.push_back(remap(obj.norm_remap, c.vn, [&] {
                        return mesh.map_create_vert(obj.norm_map, &normals[c.vn][0]);
                    }));
                }
            }

            if (!mat_name.empty() && obj.material.empty())
                obj.material = mat_name;

            const int32_t poly_index = mesh.create_poly(pv);
            if (poly_index < 0)
            {
                report.warning("line " + std::to_string(line_no) + ": face skipped (invalid vertex)");
                continue;
            }

            if (has_uvs)
                mesh.map_create_poly(obj.uv_map, poly_index, pt);
            if (has_norms)
                mesh.map_create_poly(obj.norm_map, poly_index, pn);
        }
    }

    // Points no face uses stay in the object they were declared in; points
    // declared before any object go to the first one.
    for (size_t v = 0; v < positions.size(); ++v)
    {
        if (vert_used[v])
            continue;

        if (builders.empty())
            object_named(builders, by_name, "default");

        const size_t owner = vert_owner[v] == kNoOwner ? 0 : vert_owner[v];
        builders[owner].mesh->create_vert(positions[v]);
    }

    // Load material library if defined
    if (!mat_lib.empty() && !base_dir.empty())
    {
        const std::filesystem::path mtl_path = std::filesystem::path(base_dir) / mat_lib;
        if (!loadObjMaterialsFromFile(mtl_path.string(), materials))
            report.warning("material library not found: " + mtl_path.string());
    }

    for (ObjectBuilder& b : builders)
    {
        if (b.mesh->num_verts() == 0)
            continue;

        ObjObject obj;
        obj.name     = b.name;
        obj.mesh     = std::move(b.mesh);
        obj.material = b.material;
        objects.push_back(std::move(obj));
    }

    return report.ok();
}

bool loadObjMaterialsFromFile(const std::string& filename, ObjMaterials& materials)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file " << filename << "\n";
        return false;
    }

    const std::filesystem::path mtl_dir = std::filesystem::path(filename).parent_path();

    int64_t     mat_index = -1;
    std::string line;

    while (std::getline(file, line))
    {
        line = trim(line);

        // Ignore empty lines and comments
        if (line.empty() || line[0] == '#')
            continue;

        // Check for new material
        if (line.rfind("newmtl ", 0) == 0)
        {
            mat_index = add_material(trim(line.substr(7)), materials);
        }
        else if (mat_index < 0)
        {
            continue;
        }
        // Parse Kd (diffuse color)
        else if (line.rfind("Kd ", 0) == 0)
        {
            std::istringstream stream(line.substr(3));
            glm::vec3&         kd = materials[mat_index].Kd;
            stream >> kd.r >> kd.g >> kd.b;
        }
        // Parse map_Kd (diffuse texture map)
        else if (line.rfind("map_Kd ", 0) == 0)
        {
            const std::filesystem::path tex = trim(line.substr(7));
            materials[mat_index].map_Kd     = tex.is_absolute() ? tex.string() : (mtl_dir / tex).string();
        }
    }

    return true;
}
