#include "mpcopy/copy/part_copier.hpp"
#include "mpcopy/storage/wire_format.hpp"

#include <spdlog/spdlog.h>

namespace mpcopy::copy {

Result<PartResult> PartCopier::copy_part(const ObjectLocation& source,
                                         const ObjectLocation& destination,
                                         const std::string& upload_id,
                                         const PartRange& range) const {
    storage::UploadPartCopyRequest request;
    request.destination = destination;
    request.upload_id = upload_id;
    request.part_number = range.part_number;
    request.copy_source = storage::encode_copy_source(source);
    request.copy_source_range = storage::format_copy_source_range(range.bytes());

    spdlog::trace("PUT part {} range {} upload {}", range.part_number, request.copy_source_range, upload_id);

    auto etag = client_.upload_part_copy(request);
    if (etag.is_error()) {
        return Err<PartResult>(etag.error());
    }
    if (etag.value().empty()) {
        return Err<PartResult>(make_error(ErrorKind::TransportFailure,
            "copy-part response carried no ETag",
            {{"part_number", range.part_number}, {"upload_id", upload_id}}));
    }

    return Ok(PartResult{range.part_number, std::move(etag.value())});
}

CopyError part_exception_error(int part_number, const std::exception& e) {
    return make_error(ErrorKind::TransportFailure, std::string("part copy threw: ") + e.what(),
                      {{"part_number", part_number}});
}

Result<PartResult> collect_part_result(std::future<Result<PartResult>>& pending, int part_number) {
    try {
        return pending.get();
    } catch (const std::exception& e) {
        spdlog::error("Part {} task threw: {}", part_number, e.what());
        return Err<PartResult>(part_exception_error(part_number, e));
    }
}

} // namespace mpcopy::copy
