//
// Created by lewis on 4/3/24.
//

#include "FhirResources.h"
#include <map>
#include <set>
#include <stdexcept>

namespace {
    const std::set<std::string>& fhirResourceTypes() {
        static const std::set<std::string> resourceTypes = {
                "Account", "ActivityDefinition", "AdverseEvent", "AllergyIntolerance", "Appointment",
                "AppointmentResponse", "AuditEvent", "Basic", "Binary", "BiologicallyDerivedProduct", "BodyStructure",
                "Bundle", "CapabilityStatement", "CarePlan", "CareTeam", "CatalogEntry", "ChargeItem",
                "ChargeItemDefinition", "Claim", "ClaimResponse", "ClinicalImpression", "CodeSystem", "Communication",
                "CommunicationRequest", "CompartmentDefinition", "Composition", "ConceptMap", "Condition", "Consent",
                "Contract", "Coverage", "CoverageEligibilityRequest", "CoverageEligibilityResponse", "DetectedIssue",
                "Device", "DeviceDefinition", "DeviceMetric", "DeviceRequest", "DeviceUseStatement",
                "DiagnosticReport", "DocumentManifest", "DocumentReference", "EffectEvidenceSynthesis", "Encounter",
                "Endpoint", "EnrollmentRequest", "EnrollmentResponse", "EpisodeOfCare", "EventDefinition", "Evidence",
                "EvidenceVariable", "ExampleScenario", "ExplanationOfBenefit", "FamilyMemberHistory", "Flag", "Goal",
                "GraphDefinition", "Group", "GuidanceResponse", "HealthcareService", "ImagingStudy", "Immunization",
                "ImmunizationEvaluation", "ImmunizationRecommendation", "ImplementationGuide", "InsurancePlan",
                "Invoice", "Library", "Linkage", "List", "Location", "Measure", "MeasureReport", "Media", "Medication",
                "MedicationAdministration", "MedicationDispense", "MedicationKnowledge", "MedicationRequest",
                "MedicationStatement", "MedicinalProduct", "MedicinalProductAuthorization",
                "MedicinalProductContraindication", "MedicinalProductIndication", "MedicinalProductIngredient",
                "MedicinalProductInteraction", "MedicinalProductManufactured", "MedicinalProductPackaged",
                "MedicinalProductPharmaceutical", "MedicinalProductUndesirableEffect", "MessageDefinition",
                "MessageHeader", "MolecularSequence", "NamingSystem", "NutritionOrder", "Observation",
                "ObservationDefinition", "OperationDefinition", "OperationOutcome", "Organization",
                "OrganizationAffiliation", "Parameters", "Patient", "PaymentNotice", "PaymentReconciliation", "Person",
                "PlanDefinition", "Practitioner", "PractitionerRole", "Procedure", "Provenance", "Questionnaire",
                "QuestionnaireResponse", "RelatedPerson", "RequestGroup", "ResearchDefinition",
                "ResearchElementDefinition", "ResearchStudy", "ResearchSubject", "RiskAssessment",
                "RiskEvidenceSynthesis", "Schedule", "SearchParameter", "ServiceRequest", "Slot", "Specimen",
                "SpecimenDefinition", "StructureDefinition", "StructureMap", "Subscription", "Substance",
                "SubstanceNucleicAcid", "SubstancePolymer", "SubstanceProtein", "SubstanceReferenceInformation",
                "SubstanceSourceMaterial", "SubstanceSpecification", "SupplyDelivery", "SupplyRequest", "Task",
                "TerminologyCapabilities", "TestReport", "TestScript", "ValueSet", "VerificationResult",
                "VisionPrescription"
        };

        return resourceTypes;
    }
}

auto isFhirResourceType(const std::string& resourceType) -> bool {
    return fhirResourceTypes().contains(resourceType);
}

void validateResource(const nlohmann::json& resource, const std::string& expectedType) {
    if (!resource.is_object()) {
        throw std::invalid_argument("Resource is not an object");
    }

    auto resourceType = resource.contains("resourceType") && resource["resourceType"].is_string()
                        ? resource["resourceType"].get<std::string>() : std::string{};

    if (!isFhirResourceType(resourceType)) {
        throw std::invalid_argument("Invalid FHIR resourceType: " + resourceType);
    }

    if (!resource.contains("id") || !resource["id"].is_string() || resource["id"].get<std::string>().empty()) {
        throw std::invalid_argument("Resource ID is missing or invalid");
    }

    if (!expectedType.empty() && resourceType != expectedType) {
        throw std::invalid_argument(
                "Resource type " + resourceType + " does not match expected type " + expectedType
        );
    }
}

auto extensionFromContentType(const std::string& contentType) -> std::string {
    static const std::map<std::string, std::string> mimeToExtension = {
            {"image/jpeg", ".jpg"},
            {"image/jpg", ".jpg"},
            {"image/png", ".png"},
            {"image/gif", ".gif"},
            {"image/bmp", ".bmp"},
            {"image/svg+xml", ".svg"},
            {"application/pdf", ".pdf"},
            {"application/msword", ".doc"},
            {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", ".docx"},
            {"text/plain", ".txt"},
            {"text/html", ".html"},
            {"application/xml", ".xml"},
            {"text/xml", ".xml"},
            {"application/json", ".json"},
            {"text/csv", ".csv"}
    };

    auto extension = mimeToExtension.find(contentType);
    return extension == mimeToExtension.end() ? std::string{} : extension->second;
}
