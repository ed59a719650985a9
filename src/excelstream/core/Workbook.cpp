#include "Workbook.hpp"
#include "excelstream/core/StreamWriter.hpp"
#include "excelstream/xml/WorksheetXMLGenerator.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace excelstream {
namespace core {

namespace {

constexpr size_t kMaxSheetNameLength = 31;

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

std::unique_ptr<Workbook> Workbook::create(const WorkbookOptions& options) {
    return std::make_unique<Workbook>(options);
}

Workbook::Workbook(const WorkbookOptions& options)
    : options_(options) {
    CORE_DEBUG("Workbook created");
}

Workbook::~Workbook() {
    if (!open_writers_.empty()) {
        CORE_WARN("Workbook destroyed while {} streaming session(s) are still open", open_writers_.size());
    }
    for (auto& entry : open_writers_) {
        entry.second->detachWorkbook();
    }
}

VoidResult Workbook::validateSheetName(const std::string& name) {
    if (name.empty()) {
        return makeError(ErrorCode::InvalidArgument, "sheet name cannot be empty");
    }
    if (name.size() > kMaxSheetNameLength) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("sheet name \"{}\" exceeds {} characters", name, kMaxSheetNameLength));
    }
    if (name.find_first_of(":\\/?*[]") != std::string::npos) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("sheet name \"{}\" contains invalid characters", name));
    }
    if (name.front() == '\'' || name.back() == '\'') {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("sheet name \"{}\" cannot start or end with an apostrophe", name));
    }
    return {};
}

Result<int> Workbook::addSheet(const std::string& name) {
    auto valid = validateSheetName(name);
    if (!valid) {
        return std::move(valid).error();
    }
    if (getSheetIndex(name) != 0) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("sheet \"{}\" already exists", name));
    }

    worksheets_.push_back(std::make_unique<WorksheetModel>(name));
    int sheet_id = static_cast<int>(worksheets_.size());
    CORE_DEBUG("Added sheet '{}' as sheet{}", name, sheet_id);
    return sheet_id;
}

int Workbook::getSheetIndex(const std::string& name) const {
    for (size_t i = 0; i < worksheets_.size(); ++i) {
        if (equalsIgnoreCase(worksheets_[i]->getName(), name)) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(worksheets_.size());
    for (const auto& sheet : worksheets_) {
        names.push_back(sheet->getName());
    }
    return names;
}

Result<WorksheetModel*> Workbook::getWorksheetModel(int sheet_id) {
    if (sheet_id < 1 || static_cast<size_t>(sheet_id) > worksheets_.size()) {
        return makeError(ErrorCode::InvalidWorksheet,
                         fmt::format("sheet{} does not exist", sheet_id));
    }
    return worksheets_[static_cast<size_t>(sheet_id) - 1].get();
}

Result<WorksheetModel*> Workbook::getWorksheetModel(const std::string& name) {
    int sheet_id = getSheetIndex(name);
    if (sheet_id == 0) {
        return makeError(ErrorCode::InvalidWorksheet,
                         fmt::format("sheet {} does not exist", name));
    }
    return getWorksheetModel(sheet_id);
}

std::string Workbook::sheetPartPath(int sheet_id) {
    return fmt::format("xl/worksheets/sheet{}.xml", sheet_id);
}

void Workbook::setPart(const std::string& path, std::string bytes) {
    parts_[path] = std::move(bytes);
}

const std::string* Workbook::getPart(const std::string& path) const {
    auto it = parts_.find(path);
    return it == parts_.end() ? nullptr : &it->second;
}

bool Workbook::hasPart(const std::string& path) const {
    return parts_.find(path) != parts_.end();
}

VoidResult Workbook::writeSheetParts() {
    for (size_t i = 0; i < worksheets_.size(); ++i) {
        const int sheet_id = static_cast<int>(i) + 1;
        const std::string path = sheetPartPath(sheet_id);
        if (hasPart(path)) {
            continue;
        }
        if (isSheetLocked(sheet_id)) {
            return makeError(ErrorCode::SheetLocked,
                             fmt::format("sheet \"{}\" has an unfinished streaming session",
                                         worksheets_[i]->getName()));
        }
        auto rendered = renderSheet(sheet_id);
        if (!rendered) {
            return std::move(rendered).error();
        }
        setPart(path, *rendered.value());
    }
    return {};
}

Result<const std::string*> Workbook::renderSheet(int sheet_id) {
    const std::string path = sheetPartPath(sheet_id);
    auto cached = rendered_cache_.find(path);
    if (cached != rendered_cache_.end()) {
        return &cached->second;
    }

    auto model = getWorksheetModel(sheet_id);
    if (!model) {
        return std::move(model).error();
    }
    auto document = xml::WorksheetXMLGenerator(*model.value()).generate();
    if (!document) {
        return std::move(document).error();
    }

    auto inserted = rendered_cache_.emplace(path, std::move(document).value());
    checked_.insert(path);
    return &inserted.first->second;
}

bool Workbook::isSheetCached(const std::string& path) const {
    return rendered_cache_.find(path) != rendered_cache_.end();
}

bool Workbook::isSheetChecked(const std::string& path) const {
    return checked_.find(path) != checked_.end();
}

void Workbook::evictSheetCache(const std::string& path) {
    rendered_cache_.erase(path);
    checked_.erase(path);
}

Result<std::unique_ptr<StreamWriter>> Workbook::newStreamWriter(const std::string& sheet) {
    return newStreamWriter(sheet, options_.stream);
}

Result<std::unique_ptr<StreamWriter>> Workbook::newStreamWriter(const std::string& sheet,
                                                                const StreamWriterOptions& options) {
    int sheet_id = getSheetIndex(sheet);
    if (sheet_id == 0) {
        return makeError(ErrorCode::InvalidWorksheet, fmt::format("sheet {} does not exist", sheet));
    }

    if (isSheetLocked(sheet_id)) {
        return makeError(ErrorCode::SheetLocked,
                         fmt::format("sheet{} already has an open streaming session", sheet_id));
    }

    std::unique_ptr<StreamWriter> writer(
        new StreamWriter(this, worksheets_[static_cast<size_t>(sheet_id) - 1]->getName(), sheet_id, options));
    open_writers_[sheet_id] = writer.get();
    return writer;
}

void Workbook::releaseSheetLease(int sheet_id) {
    open_writers_.erase(sheet_id);
}

}} // namespace excelstream::core
