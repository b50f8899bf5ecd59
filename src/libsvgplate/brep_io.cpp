// =====================================================================
//  src/libsvgplate/brep_io.cpp — BREP file read/write
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/brep_io.h>

#include <BRep_Builder.hxx>
#include <BRepTools.hxx>
#include <TopExp_Explorer.hxx>

#include <QFile>

#include <string>

namespace svgplate {
namespace brep_io {

TopoDS_Shape readBrep(const QString& path, QString* errorMsg)
{
    if (!QFile::exists(path)) {
        if (errorMsg) *errorMsg = QStringLiteral("File not found: ") + path;
        return TopoDS_Shape();
    }

    BRep_Builder builder;
    TopoDS_Shape shape;

    std::string stdPath = path.toStdString();
    if (!BRepTools::Read(shape, stdPath.c_str(), builder) || shape.IsNull()) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read BREP file: ") + path;
        return TopoDS_Shape();
    }

    return shape;
}

bool writeBrep(const QString& path, const TopoDS_Shape& shape,
               QString* errorMsg)
{
    if (shape.IsNull()) {
        if (errorMsg) *errorMsg = QStringLiteral("No shape to write");
        return false;
    }

    std::string stdPath = path.toStdString();
    if (!BRepTools::Write(shape, stdPath.c_str())) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write BREP file: ") + path;
        return false;
    }

    return true;
}

int solidCount(const TopoDS_Shape& shape)
{
    if (shape.IsNull()) return 0;

    int count = 0;
    for (TopExp_Explorer exp(shape, TopAbs_SOLID); exp.More(); exp.Next()) {
        ++count;
    }
    return count;
}

}  // namespace brep_io
}  // namespace svgplate
