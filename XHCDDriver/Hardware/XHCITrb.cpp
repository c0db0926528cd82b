#include "XHCITrb.hpp"

namespace XHCD::HW {

const char* ToString(TrbType type) noexcept {
    switch (type) {
        case TrbType::Reserved:                 return "Reserved";
        case TrbType::Normal:                   return "Normal";
        case TrbType::SetupStage:               return "SetupStage";
        case TrbType::DataStage:                return "DataStage";
        case TrbType::StatusStage:              return "StatusStage";
        case TrbType::Isoch:                    return "Isoch";
        case TrbType::Link:                     return "Link";
        case TrbType::EventData:                return "EventData";
        case TrbType::NoOp:                     return "NoOp";
        case TrbType::EnableSlot:               return "EnableSlot";
        case TrbType::DisableSlot:              return "DisableSlot";
        case TrbType::AddressDevice:            return "AddressDevice";
        case TrbType::ConfigureEndpoint:        return "ConfigureEndpoint";
        case TrbType::EvaluateContext:          return "EvaluateContext";
        case TrbType::ResetEndpoint:            return "ResetEndpoint";
        case TrbType::StopEndpoint:             return "StopEndpoint";
        case TrbType::SetTrDequeuePointer:      return "SetTrDequeuePointer";
        case TrbType::ResetDevice:              return "ResetDevice";
        case TrbType::ForceEvent:               return "ForceEvent";
        case TrbType::NegotiateBandwidth:       return "NegotiateBandwidth";
        case TrbType::SetLatencyToleranceValue: return "SetLatencyToleranceValue";
        case TrbType::GetPortBandwidth:         return "GetPortBandwidth";
        case TrbType::ForceHeader:              return "ForceHeader";
        case TrbType::NoOpCmd:                  return "NoOpCmd";
        case TrbType::GetExtendedProperty:      return "GetExtendedProperty";
        case TrbType::SetExtendedProperty:      return "SetExtendedProperty";
        case TrbType::Transfer:                 return "Transfer";
        case TrbType::CommandCompletion:        return "CommandCompletion";
        case TrbType::PortStatusChange:         return "PortStatusChange";
        case TrbType::BandwidthRequest:         return "BandwidthRequest";
        case TrbType::Doorbell:                 return "Doorbell";
        case TrbType::HostController:           return "HostController";
        case TrbType::DeviceNotification:       return "DeviceNotification";
        case TrbType::MfindexWrap:              return "MfindexWrap";
        default:                                return "Rsvd";
    }
}

const char* ToString(CompletionCode code) noexcept {
    switch (code) {
        case CompletionCode::Invalid:                return "Invalid";
        case CompletionCode::Success:                return "Success";
        case CompletionCode::DataBuffer:             return "DataBuffer";
        case CompletionCode::BabbleDetected:         return "BabbleDetected";
        case CompletionCode::UsbTransaction:         return "UsbTransaction";
        case CompletionCode::Trb:                    return "Trb";
        case CompletionCode::Stall:                  return "Stall";
        case CompletionCode::Resource:               return "Resource";
        case CompletionCode::Bandwidth:              return "Bandwidth";
        case CompletionCode::NoSlotsAvailable:       return "NoSlotsAvailable";
        case CompletionCode::InvalidStreamType:      return "InvalidStreamType";
        case CompletionCode::SlotNotEnabled:         return "SlotNotEnabled";
        case CompletionCode::EndpointNotEnabled:     return "EndpointNotEnabled";
        case CompletionCode::ShortPacket:            return "ShortPacket";
        case CompletionCode::RingUnderrun:           return "RingUnderrun";
        case CompletionCode::RingOverrun:            return "RingOverrun";
        case CompletionCode::VfEventRingFull:        return "VfEventRingFull";
        case CompletionCode::Parameter:              return "Parameter";
        case CompletionCode::BandwidthOverrun:       return "BandwidthOverrun";
        case CompletionCode::ContextState:           return "ContextState";
        case CompletionCode::NoPingResponse:         return "NoPingResponse";
        case CompletionCode::EventRingFull:          return "EventRingFull";
        case CompletionCode::IncompatibleDevice:     return "IncompatibleDevice";
        case CompletionCode::MissedService:          return "MissedService";
        case CompletionCode::CommandRingStopped:     return "CommandRingStopped";
        case CompletionCode::CommandAborted:         return "CommandAborted";
        case CompletionCode::Stopped:                return "Stopped";
        case CompletionCode::StoppedLengthInvalid:   return "StoppedLengthInvalid";
        case CompletionCode::StoppedShortPacket:     return "StoppedShortPacket";
        case CompletionCode::MaxExitLatencyTooLarge: return "MaxExitLatencyTooLarge";
        case CompletionCode::IsochBuffer:            return "IsochBuffer";
        case CompletionCode::EventLost:              return "EventLost";
        case CompletionCode::Undefined:              return "Undefined";
        case CompletionCode::InvalidStreamId:        return "InvalidStreamId";
        case CompletionCode::SecondaryBandwidth:     return "SecondaryBandwidth";
        case CompletionCode::SplitTransaction:       return "SplitTransaction";
        default:                                     return "Rsvd";
    }
}

} // namespace XHCD::HW
