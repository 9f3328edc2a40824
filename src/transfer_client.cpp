#include "transfer_client.hpp"
#include "ftp_transfer.hpp"
#include "sftp_transfer.hpp"

ProtocolTransferClient::ProtocolTransferClient(int timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {}

std::expected<std::unique_ptr<TransferSession>, TransferError> ProtocolTransferClient::connect(const Profile& profile) {
    switch (profile.transport) {
        case TransportMode::Ftp:
        case TransportMode::Ftps: {
            FtpTransferClient client(timeoutSeconds_);
            return client.connect(profile);
        }
        case TransportMode::Sftp: {
            SftpTransferClient client(timeoutSeconds_);
            return client.connect(profile);
        }
    }
    return std::unexpected(TransferError{TransferErrorKind::Connect, "Unsupported transport mode"});
}
