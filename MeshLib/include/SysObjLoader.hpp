#ifndef SYS_OBJ_LOADER_HPP_INCLUDED
#define SYS_OBJ_LOADER_HPP_INCLUDED

#include <glm/vec3.hpp>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

class SysMesh;

/// Represents the material properties the checker cares about in MTL files.
struct ObjMaterial
{
    std::string name;   ///< Material name (newmtl)
    glm::vec3   Kd;     ///< Diffuse color
    std::string map_Kd; ///< Diffuse texture map, resolved against the MTL directory
};

using ObjMaterials = std::vector<ObjMaterial>;

/// One named object ("o" or "g" block) of an OBJ file.
struct ObjObject
{
    std::string              name;
    std::shared_ptr<SysMesh> mesh;
    std::string              material; ///< First material used by the object's faces, if any.
};

/// Status code for OBJ loading.
enum class ObjLoadStatus
{
    Ok,
    FileNotFound,
    ParseError
};

/// Messages and final status of one OBJ load.
struct ObjLoadReport
{
    ObjLoadStatus            status{ObjLoadStatus::Ok};
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void warning(std::string msg)
    {
        warnings.push_back(std::move(msg));
    }

    void error(std::string msg, ObjLoadStatus code = ObjLoadStatus::ParseError)
    {
        errors.push_back(std::move(msg));
        if (status == ObjLoadStatus::Ok)
            status = code;
    }

    [[nodiscard]] bool ok() const noexcept
    {
        return status == ObjLoadStatus::Ok;
    }
};

/// Loads an OBJ file, one SysMesh per object, along with its material library (MTL).
/// Faces that reference missing vertices or have fewer than 3 corners are skipped
/// with a warning; they never fail the load. Points no face uses are kept, after
/// the face vertices, in the object that was active when they were declared.
/// @param filepath - The full path of the OBJ file.
/// @param objects - Receives the loaded objects in file order.
/// @param materials - Receives materials from the MTL library, if any.
/// @param report - Warnings, errors and the final status.
/// @return True if loading succeeded, false otherwise.
bool loadObjObjects(const std::string& filepath,
                    std::vector<ObjObject>& objects,
                    ObjMaterials& materials,
                    ObjLoadReport& report);

/// Same as loadObjObjects() but parses an already opened stream. MTL libraries
/// are resolved against @p base_dir; pass an empty string to skip them.
bool loadObjStream(std::istream& in,
                   const std::string& base_dir,
                   std::vector<ObjObject>& objects,
                   ObjMaterials& materials,
                   ObjLoadReport& report);

/// Reads newmtl/Kd/map_Kd entries from an MTL file into @p materials.
bool loadObjMaterialsFromFile(const std::string& filename, ObjMaterials& materials);

#endif // SYS_OBJ_LOADER_HPP_INCLUDED
